/*
 * 설명: HS256 액세스 토큰의 발급과 검증, base64url 인코딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_service_test.cpp
 */
#include "dispatch/token_service.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace dispatch {
namespace {
std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("토큰 식별자 난수 생성 실패");
  }
  std::ostringstream oss;
  for (auto byte : buffer) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}

std::optional<std::string> SubjectFromClaim(const nlohmann::json& claim) {
  if (claim.is_string() && !claim.get<std::string>().empty()) {
    return claim.get<std::string>();
  }
  if (claim.is_number_integer()) {
    return std::to_string(claim.get<long long>());
  }
  return std::nullopt;
}
}  // namespace

std::string Base64UrlEncode(const std::string& input) {
  if (input.empty()) {
    return {};
  }
  std::string encoded(4 * ((input.size() + 2) / 3), '\0');
  int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                            reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size()));
  encoded.resize(static_cast<std::size_t>(len));
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  for (auto& ch : encoded) {
    if (ch == '+') {
      ch = '-';
    } else if (ch == '/') {
      ch = '_';
    }
  }
  return encoded;
}

std::optional<std::string> Base64UrlDecode(const std::string& input) {
  if (input.empty()) {
    return std::string{};
  }
  if (input.size() % 4 == 1) {
    return std::nullopt;
  }
  std::string padded = input;
  for (auto& ch : padded) {
    if (ch == '-') {
      ch = '+';
    } else if (ch == '_') {
      ch = '/';
    } else if (ch == '+' || ch == '/' || ch == '=') {
      return std::nullopt;
    }
  }
  std::size_t padding = (4 - padded.size() % 4) % 4;
  padded.append(padding, '=');
  std::string decoded(padded.size() / 4 * 3, '\0');
  int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                            reinterpret_cast<const unsigned char*>(padded.data()), static_cast<int>(padded.size()));
  if (len < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 바이트까지 0으로 채워 길이에 포함한다.
  decoded.resize(static_cast<std::size_t>(len) - padding);
  return decoded;
}

HmacTokenService::HmacTokenService(std::string secret) : secret_(std::move(secret)) {}

std::string HmacTokenService::Sign(const std::string& signing_input) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
            reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(), digest, &digest_len)) {
    throw std::runtime_error("HMAC 서명 실패");
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string HmacTokenService::Issue(const std::string& subject_id, std::chrono::seconds ttl) const {
  if (secret_.empty()) {
    throw std::runtime_error("서명 키 없이 토큰을 발급할 수 없습니다");
  }
  auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch());
  nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};
  nlohmann::json claims{{"token_type", "access"},
                        {"user_id", subject_id},
                        {"iat", now.count()},
                        {"exp", (now + ttl).count()},
                        {"jti", RandomHex(16)}};
  std::string signing_input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(claims.dump());
  return signing_input + "." + Base64UrlEncode(Sign(signing_input));
}

std::optional<std::string> HmacTokenService::Verify(const std::string& token) const {
  if (secret_.empty() || token.empty()) {
    return std::nullopt;
  }
  auto first_dot = token.find('.');
  auto second_dot = first_dot == std::string::npos ? std::string::npos : token.find('.', first_dot + 1);
  if (second_dot == std::string::npos || token.find('.', second_dot + 1) != std::string::npos) {
    return std::nullopt;
  }
  auto header_raw = Base64UrlDecode(token.substr(0, first_dot));
  auto claims_raw = Base64UrlDecode(token.substr(first_dot + 1, second_dot - first_dot - 1));
  auto signature = Base64UrlDecode(token.substr(second_dot + 1));
  if (!header_raw || !claims_raw || !signature) {
    return std::nullopt;
  }

  auto header = nlohmann::json::parse(*header_raw, nullptr, false);
  if (!header.is_object() || header.value("alg", std::string{}) != "HS256") {
    return std::nullopt;
  }

  auto expected = Sign(token.substr(0, second_dot));
  if (expected.size() != signature->size() ||
      CRYPTO_memcmp(expected.data(), signature->data(), expected.size()) != 0) {
    return std::nullopt;
  }

  auto claims = nlohmann::json::parse(*claims_raw, nullptr, false);
  if (!claims.is_object()) {
    return std::nullopt;
  }
  auto exp_it = claims.find("exp");
  if (exp_it == claims.end() || !exp_it->is_number()) {
    return std::nullopt;
  }
  auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch());
  if (exp_it->get<double>() <= static_cast<double>(now.count())) {
    return std::nullopt;
  }
  auto type_it = claims.find("token_type");
  if (type_it == claims.end() || !type_it->is_string() || type_it->get<std::string>() != "access") {
    return std::nullopt;
  }
  auto subject_it = claims.find("user_id");
  if (subject_it == claims.end()) {
    return std::nullopt;
  }
  return SubjectFromClaim(*subject_it);
}

}  // namespace dispatch
