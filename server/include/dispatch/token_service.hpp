/*
 * 설명: 외부 신뢰 서비스 계약(토큰 → 주체 식별자)과 HS256 서명 액세스 토큰 구현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_service_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace dispatch {

class TokenVerifier {
 public:
  virtual ~TokenVerifier() = default;
  // 서명 불일치, 만료, 형식 오류는 모두 nullopt.
  virtual std::optional<std::string> Verify(const std::string& token) const = 0;
};

class HmacTokenService : public TokenVerifier {
 public:
  explicit HmacTokenService(std::string secret);

  std::string Issue(const std::string& subject_id, std::chrono::seconds ttl) const;
  std::optional<std::string> Verify(const std::string& token) const override;

  bool HasSecret() const { return !secret_.empty(); }

 private:
  std::string Sign(const std::string& signing_input) const;

  std::string secret_;
};

std::string Base64UrlEncode(const std::string& input);
std::optional<std::string> Base64UrlDecode(const std::string& input);

}  // namespace dispatch
