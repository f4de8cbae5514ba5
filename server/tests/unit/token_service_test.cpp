#include <chrono>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "dispatch/token_service.hpp"

namespace {

std::string Segment(const std::string& token, int index) {
  std::size_t start = 0;
  for (int i = 0; i < index; ++i) {
    start = token.find('.', start) + 1;
  }
  auto end = token.find('.', start);
  return token.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string SignClaims(const std::string& secret, const nlohmann::json& claims) {
  auto signing_input = dispatch::Base64UrlEncode(nlohmann::json{{"alg", "HS256"}, {"typ", "JWT"}}.dump()) + "." +
                       dispatch::Base64UrlEncode(claims.dump());
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
       reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(), digest, &digest_len);
  return signing_input + "." + dispatch::Base64UrlEncode(std::string(reinterpret_cast<const char*>(digest), digest_len));
}

long long SecondsFromNow(long long offset) {
  auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch());
  return now.count() + offset;
}

}  // namespace

TEST(TokenServiceTest, IssuedTokenVerifiesToSubject) {
  dispatch::HmacTokenService service("secret-key");
  auto token = service.Issue("17", std::chrono::seconds(60));
  auto subject = service.Verify(token);
  ASSERT_TRUE(subject.has_value());
  EXPECT_EQ(*subject, "17");

  auto claims = nlohmann::json::parse(*dispatch::Base64UrlDecode(Segment(token, 1)));
  EXPECT_EQ(claims["token_type"], "access");
  EXPECT_EQ(claims["user_id"], "17");
  EXPECT_TRUE(claims.contains("jti"));
  EXPECT_GT(claims["exp"].get<long long>(), claims["iat"].get<long long>());
}

TEST(TokenServiceTest, RejectsWrongSecret) {
  dispatch::HmacTokenService issuer("secret-key");
  dispatch::HmacTokenService other("other-key");
  EXPECT_FALSE(other.Verify(issuer.Issue("17", std::chrono::seconds(60))).has_value());
}

TEST(TokenServiceTest, RejectsExpiredToken) {
  dispatch::HmacTokenService service("secret-key");
  EXPECT_FALSE(service.Verify(service.Issue("17", std::chrono::seconds(-5))).has_value());
}

TEST(TokenServiceTest, RejectsTamperedPayload) {
  dispatch::HmacTokenService service("secret-key");
  auto token = service.Issue("17", std::chrono::seconds(60));
  auto forged_claims = nlohmann::json::parse(*dispatch::Base64UrlDecode(Segment(token, 1)));
  forged_claims["user_id"] = "1";
  auto forged = Segment(token, 0) + "." + dispatch::Base64UrlEncode(forged_claims.dump()) + "." + Segment(token, 2);
  EXPECT_FALSE(service.Verify(forged).has_value());
}

TEST(TokenServiceTest, RequiresAccessTokenType) {
  dispatch::HmacTokenService service("secret-key");
  nlohmann::json claims{{"user_id", 17}, {"exp", SecondsFromNow(60)}};
  EXPECT_FALSE(service.Verify(SignClaims("secret-key", claims)).has_value());

  claims["token_type"] = "refresh";
  EXPECT_FALSE(service.Verify(SignClaims("secret-key", claims)).has_value());

  claims["token_type"] = "access";
  auto subject = service.Verify(SignClaims("secret-key", claims));
  ASSERT_TRUE(subject.has_value());
  EXPECT_EQ(*subject, "17");
}

TEST(TokenServiceTest, RejectsMalformedTokens) {
  dispatch::HmacTokenService service("secret-key");
  auto token = service.Issue("17", std::chrono::seconds(60));
  EXPECT_FALSE(service.Verify("").has_value());
  EXPECT_FALSE(service.Verify("abc").has_value());
  EXPECT_FALSE(service.Verify("a.b").has_value());
  EXPECT_FALSE(service.Verify(token + ".extra").has_value());
  EXPECT_FALSE(service.Verify("!!!." + Segment(token, 1) + "." + Segment(token, 2)).has_value());
}

TEST(TokenServiceTest, EmptySecretNeverVerifies) {
  dispatch::HmacTokenService service("");
  EXPECT_FALSE(service.HasSecret());
  EXPECT_THROW(service.Issue("17", std::chrono::seconds(60)), std::runtime_error);
  EXPECT_FALSE(service.Verify("a.b.c").has_value());
}

TEST(TokenServiceTest, Base64UrlHasNoPaddingOrUnsafeCharacters) {
  std::string binary{"\xfb\xff\xfe", 3};
  auto encoded = dispatch::Base64UrlEncode(binary);
  EXPECT_EQ(encoded, "-__-");
  EXPECT_EQ(dispatch::Base64UrlDecode(encoded), binary);
  EXPECT_EQ(dispatch::Base64UrlEncode("ab"), "YWI");
  EXPECT_EQ(dispatch::Base64UrlDecode("YWI"), std::string("ab"));
  EXPECT_FALSE(dispatch::Base64UrlDecode("YW=I").has_value());
}
