/*
 * 설명: 쿼리 토큰 추출, 토큰 검증, 주체 조회로 연결 신원을 해석하고 입장 정책을 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/trust_gate_test.cpp
 */
#include "dispatch/trust_gate.hpp"

namespace dispatch {
namespace {
int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::string PercentDecode(std::string_view value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char ch = value[i];
    if (ch == '+') {
      decoded.push_back(' ');
    } else if (ch == '%' && i + 2 < value.size() && HexValue(value[i + 1]) >= 0 && HexValue(value[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(HexValue(value[i + 1]) * 16 + HexValue(value[i + 2])));
      i += 2;
    } else {
      decoded.push_back(ch);
    }
  }
  return decoded;
}
}  // namespace

std::optional<std::string> ExtractQueryParam(std::string_view target, std::string_view key) {
  auto pos = target.find('?');
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  auto query = target.substr(pos + 1);
  auto fragment = query.find('#');
  if (fragment != std::string_view::npos) {
    query = query.substr(0, fragment);
  }
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    auto eq = pair.find('=');
    auto name = pair.substr(0, eq);
    if (name == key) {
      if (eq == std::string_view::npos) {
        return std::string{};
      }
      return PercentDecode(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query = query.substr(amp + 1);
  }
  return std::nullopt;
}

TrustGate::TrustGate(std::shared_ptr<TokenVerifier> verifier, std::shared_ptr<StorageService> storage,
                     std::shared_ptr<Observability> observability)
    : verifier_(std::move(verifier)), storage_(std::move(storage)), observability_(std::move(observability)) {}

ConnectionIdentity TrustGate::Authenticate(std::string_view target) const {
  return AuthenticateToken(ExtractQueryParam(target, "token"));
}

ConnectionIdentity TrustGate::AuthenticateToken(const std::optional<std::string>& token) const {
  if (!token || token->empty()) {
    return Anonymous("missing_token");
  }
  std::optional<std::string> subject;
  try {
    subject = verifier_->Verify(*token);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kWarn, "trust.verify_failed", {{"error", ex.what()}});
    }
    return Anonymous("invalid_token");
  }
  if (!subject) {
    return Anonymous("invalid_token");
  }

  std::optional<Principal> principal;
  try {
    principal = storage_->GetPrincipal(*subject);
  } catch (const StorageError& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "storage.failure",
                            {{"operation", "get_principal"}, {"error", ex.what()}});
    }
    return Anonymous("storage_unavailable");
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Event(LogLevel::kError, "trust.lookup_failed", {{"error", ex.what()}});
    }
    return Anonymous("storage_unavailable");
  }
  if (!principal) {
    return Anonymous("unknown_principal");
  }
  if (!principal->is_active) {
    return Anonymous("inactive_principal");
  }
  return ConnectionIdentity{std::move(principal), {}};
}

ConnectionIdentity TrustGate::Anonymous(std::string reason) const {
  return ConnectionIdentity{std::nullopt, std::move(reason)};
}

StrictAdmissionPolicy::StrictAdmissionPolicy()
    : allowed_roles_{Role::kDriver, Role::kRider, Role::kOwner} {}

StrictAdmissionPolicy::StrictAdmissionPolicy(std::set<Role> allowed_roles)
    : allowed_roles_(std::move(allowed_roles)) {}

AdmissionDecision StrictAdmissionPolicy::Admit(const ConnectionIdentity& identity) const {
  if (!identity.principal) {
    return {false, "unauthorized", "유효한 토큰이 필요합니다: " + identity.anonymous_reason};
  }
  if (!identity.principal->is_active) {
    return {false, "unauthorized", "비활성화된 주체입니다"};
  }
  if (allowed_roles_.count(identity.principal->role) == 0) {
    return {false, "forbidden", "허용되지 않은 역할입니다"};
  }
  return {true, {}, {}};
}

AdmissionDecision AnonymousViewerPolicy::Admit(const ConnectionIdentity& identity) const {
  if (!identity.principal) {
    return {true, {}, {}};
  }
  return authenticated_.Admit(identity);
}

}  // namespace dispatch
