/*
 * 설명: 연결 요청의 토큰을 주체로 해석하는 신뢰 게이트와, 해석 결과로 입장을 결정하는 입장 정책을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/trust_gate_test.cpp, server/tests/e2e/dispatch_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "dispatch/observability.hpp"
#include "dispatch/principal.hpp"
#include "dispatch/storage.hpp"
#include "dispatch/token_service.hpp"

namespace dispatch {

std::optional<std::string> ExtractQueryParam(std::string_view target, std::string_view key);

// principal이 없으면 익명 연결이며 anonymous_reason에 사유가 남는다.
struct ConnectionIdentity {
  std::optional<Principal> principal;
  std::string anonymous_reason;

  bool Anonymous() const { return !principal.has_value(); }
};

class TrustGate {
 public:
  TrustGate(std::shared_ptr<TokenVerifier> verifier, std::shared_ptr<StorageService> storage,
            std::shared_ptr<Observability> observability);

  // 요청 대상(URL)의 token 쿼리 파라미터를 해석한다. 예외를 던지지 않는다.
  ConnectionIdentity Authenticate(std::string_view target) const;
  ConnectionIdentity AuthenticateToken(const std::optional<std::string>& token) const;

 private:
  ConnectionIdentity Anonymous(std::string reason) const;

  std::shared_ptr<TokenVerifier> verifier_;
  std::shared_ptr<StorageService> storage_;
  std::shared_ptr<Observability> observability_;
};

struct AdmissionDecision {
  bool admitted{false};
  std::string code;
  std::string message;
};

class AdmissionPolicy {
 public:
  virtual ~AdmissionPolicy() = default;
  virtual AdmissionDecision Admit(const ConnectionIdentity& identity) const = 0;
};

class StrictAdmissionPolicy : public AdmissionPolicy {
 public:
  StrictAdmissionPolicy();
  explicit StrictAdmissionPolicy(std::set<Role> allowed_roles);

  AdmissionDecision Admit(const ConnectionIdentity& identity) const override;

 private:
  std::set<Role> allowed_roles_;
};

// 익명 연결도 받아들이되 echo.message 외의 기능은 라우터가 거부한다.
class AnonymousViewerPolicy : public AdmissionPolicy {
 public:
  AdmissionDecision Admit(const ConnectionIdentity& identity) const override;

 private:
  StrictAdmissionPolicy authenticated_;
};

}  // namespace dispatch
