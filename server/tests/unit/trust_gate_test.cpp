#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "dispatch/memory_storage.hpp"
#include "dispatch/token_service.hpp"
#include "dispatch/trust_gate.hpp"

namespace {

class ThrowingVerifier : public dispatch::TokenVerifier {
 public:
  std::optional<std::string> Verify(const std::string&) const override { throw std::runtime_error("boom"); }
};

class CorruptRowStorage : public dispatch::StorageService {
 public:
  std::optional<dispatch::Principal> GetPrincipal(const std::string&) override {
    throw std::runtime_error("unexpected column value");
  }
  dispatch::Trip CreateTrip(const dispatch::TripDraft&) override { throw std::runtime_error("unused"); }
  std::optional<dispatch::Trip> GetTrip(const std::string&) override { return std::nullopt; }
  std::optional<dispatch::Trip> UpdateTrip(const std::string&, const dispatch::TripUpdate&) override {
    return std::nullopt;
  }
  std::vector<dispatch::Trip> ListOpenTrips(const std::string&) override { return {}; }
};

class TrustGateFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    storage_ = std::make_shared<dispatch::InMemoryStorage>();
    storage_->PutPrincipal(dispatch::MakeRider("1", "+8201"));
    storage_->PutPrincipal(dispatch::MakeDriver("2", "+8202"));
    auto inactive = dispatch::MakeRider("3", "+8203");
    inactive.is_active = false;
    storage_->PutPrincipal(inactive);
    tokens_ = std::make_shared<dispatch::HmacTokenService>("gate-secret");
    observability_ = std::make_shared<dispatch::Observability>(dispatch::LogLevel::kError);
    gate_ = std::make_unique<dispatch::TrustGate>(tokens_, storage_, observability_);
  }

  std::string Target(const std::string& subject) {
    return "/ws/trip/?token=" + tokens_->Issue(subject, std::chrono::seconds(60));
  }

  std::shared_ptr<dispatch::InMemoryStorage> storage_;
  std::shared_ptr<dispatch::HmacTokenService> tokens_;
  std::shared_ptr<dispatch::Observability> observability_;
  std::unique_ptr<dispatch::TrustGate> gate_;
};

}  // namespace

TEST(QueryParamTest, ExtractsAndDecodesValues) {
  EXPECT_EQ(dispatch::ExtractQueryParam("/ws/trip/?token=abc", "token"), std::string("abc"));
  EXPECT_EQ(dispatch::ExtractQueryParam("/ws/trip/?a=1&token=x%2Ey&b=2", "token"), std::string("x.y"));
  EXPECT_EQ(dispatch::ExtractQueryParam("/ws/trip/?token=", "token"), std::string(""));
  EXPECT_FALSE(dispatch::ExtractQueryParam("/ws/trip/?tokenx=1", "token").has_value());
  EXPECT_FALSE(dispatch::ExtractQueryParam("/ws/trip/", "token").has_value());
  EXPECT_EQ(dispatch::ExtractQueryParam("/p?token=a#frag", "token"), std::string("a"));
}

TEST_F(TrustGateFixture, ValidTokenResolvesActivePrincipal) {
  auto identity = gate_->Authenticate(Target("2"));
  ASSERT_FALSE(identity.Anonymous());
  EXPECT_EQ(identity.principal->id, "2");
  EXPECT_EQ(identity.principal->role, dispatch::Role::kDriver);
  EXPECT_TRUE(identity.anonymous_reason.empty());
}

TEST_F(TrustGateFixture, DegradesToAnonymousWithReason) {
  EXPECT_EQ(gate_->Authenticate("/ws/trip/").anonymous_reason, "missing_token");
  EXPECT_EQ(gate_->Authenticate("/ws/trip/?token=").anonymous_reason, "missing_token");
  EXPECT_EQ(gate_->Authenticate("/ws/trip/?token=garbage").anonymous_reason, "invalid_token");
  EXPECT_EQ(gate_->Authenticate(Target("99")).anonymous_reason, "unknown_principal");
  EXPECT_EQ(gate_->Authenticate(Target("3")).anonymous_reason, "inactive_principal");

  dispatch::HmacTokenService foreign("other-secret");
  auto foreign_target = "/ws/trip/?token=" + foreign.Issue("1", std::chrono::seconds(60));
  EXPECT_EQ(gate_->Authenticate(foreign_target).anonymous_reason, "invalid_token");
}

TEST_F(TrustGateFixture, StorageFailureDoesNotThrow) {
  storage_->SetFailureInjector([](const std::string& op) { return op == "get_principal"; });
  dispatch::ConnectionIdentity identity;
  EXPECT_NO_THROW(identity = gate_->Authenticate(Target("1")));
  EXPECT_TRUE(identity.Anonymous());
  EXPECT_EQ(identity.anonymous_reason, "storage_unavailable");
}

TEST_F(TrustGateFixture, UnexpectedLookupExceptionDoesNotThrow) {
  dispatch::TrustGate gate(tokens_, std::make_shared<CorruptRowStorage>(), observability_);
  dispatch::ConnectionIdentity identity;
  EXPECT_NO_THROW(identity = gate.Authenticate(Target("1")));
  EXPECT_TRUE(identity.Anonymous());
  EXPECT_EQ(identity.anonymous_reason, "storage_unavailable");
}

TEST_F(TrustGateFixture, VerifierExceptionDegradesToInvalidToken) {
  dispatch::TrustGate gate(std::make_shared<ThrowingVerifier>(), storage_, observability_);
  EXPECT_EQ(gate.Authenticate("/ws/trip/?token=abc").anonymous_reason, "invalid_token");
}

TEST(AdmissionPolicyTest, StrictRejectsAnonymousAndDisallowedRoles) {
  dispatch::StrictAdmissionPolicy strict;
  dispatch::ConnectionIdentity anonymous{std::nullopt, "invalid_token"};
  auto rejected = strict.Admit(anonymous);
  EXPECT_FALSE(rejected.admitted);
  EXPECT_EQ(rejected.code, "unauthorized");

  dispatch::ConnectionIdentity rider{dispatch::MakeRider("1", "+8201"), {}};
  EXPECT_TRUE(strict.Admit(rider).admitted);

  dispatch::StrictAdmissionPolicy drivers_only({dispatch::Role::kDriver});
  auto forbidden = drivers_only.Admit(rider);
  EXPECT_FALSE(forbidden.admitted);
  EXPECT_EQ(forbidden.code, "forbidden");

  auto inactive = rider;
  inactive.principal->is_active = false;
  EXPECT_FALSE(strict.Admit(inactive).admitted);
}

TEST(AdmissionPolicyTest, ViewerPolicyAdmitsAnonymous) {
  dispatch::AnonymousViewerPolicy viewer;
  EXPECT_TRUE(viewer.Admit(dispatch::ConnectionIdentity{std::nullopt, "missing_token"}).admitted);
  EXPECT_TRUE(viewer.Admit(dispatch::ConnectionIdentity{dispatch::MakeOwner("5", "+8205"), {}}).admitted);
}
