#include <regex>
#include <set>

#include <gtest/gtest.h>

#include "dispatch/principal.hpp"
#include "dispatch/trip.hpp"

TEST(PrincipalModelTest, FactoriesSetRoleDefaults) {
  auto rider = dispatch::MakeRider("1", "+821000000001");
  EXPECT_EQ(rider.role, dispatch::Role::kRider);
  EXPECT_TRUE(rider.is_active);
  EXPECT_FALSE(rider.is_staff);

  auto driver = dispatch::MakeDriver("2", "+821000000002");
  EXPECT_EQ(driver.role, dispatch::Role::kDriver);
  EXPECT_FALSE(driver.is_staff);

  auto owner = dispatch::MakeOwner("3", "+821000000003");
  EXPECT_EQ(owner.role, dispatch::Role::kOwner);
  EXPECT_TRUE(owner.is_staff);
}

TEST(PrincipalModelTest, RoleNamesRoundTripCaseSensitively) {
  for (auto role : {dispatch::Role::kDriver, dispatch::Role::kRider, dispatch::Role::kOwner}) {
    EXPECT_EQ(dispatch::ParseRole(dispatch::RoleName(role)), role);
  }
  EXPECT_FALSE(dispatch::ParseRole("driver").has_value());
  EXPECT_FALSE(dispatch::ParseRole("").has_value());
}

TEST(PrincipalModelTest, JsonAcceptsIntegerIds) {
  auto parsed = dispatch::PrincipalFromJson(
      {{"id", 42}, {"type", "DRIVER"}, {"phone_number", "+8210"}, {"first_name", "Min"}, {"is_active", false}});
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->id, "42");
  EXPECT_EQ(parsed->role, dispatch::Role::kDriver);
  EXPECT_EQ(parsed->first_name, "Min");
  EXPECT_FALSE(parsed->is_active);

  auto json = dispatch::PrincipalToJson(*parsed);
  EXPECT_EQ(json["id"], "42");
  EXPECT_EQ(json["type"], "DRIVER");
  EXPECT_EQ(json["phone_number"], "+8210");

  EXPECT_FALSE(dispatch::PrincipalFromJson({{"id", "1"}, {"type", "ADMIN"}}).has_value());
  EXPECT_FALSE(dispatch::PrincipalFromJson({{"type", "RIDER"}}).has_value());
}

TEST(TripModelTest, StatusNamesAndParsing) {
  EXPECT_EQ(dispatch::TripStatusName(dispatch::TripStatus::kInProgress), "IN_PROGRESS");
  EXPECT_EQ(dispatch::ParseTripStatus("COMPLETED"), dispatch::TripStatus::kCompleted);
  EXPECT_FALSE(dispatch::ParseTripStatus("CANCELLED").has_value());
  EXPECT_FALSE(dispatch::ParseTripStatus("requested").has_value());
}

TEST(TripModelTest, ClassifiesTransitions) {
  using dispatch::TransitionKind;
  using dispatch::TripStatus;
  EXPECT_EQ(dispatch::ClassifyTransition(TripStatus::kRequested, TripStatus::kRequested), TransitionKind::kUnchanged);
  EXPECT_EQ(dispatch::ClassifyTransition(TripStatus::kRequested, TripStatus::kStarted), TransitionKind::kNext);
  EXPECT_EQ(dispatch::ClassifyTransition(TripStatus::kInProgress, TripStatus::kCompleted), TransitionKind::kNext);
  EXPECT_EQ(dispatch::ClassifyTransition(TripStatus::kRequested, TripStatus::kInProgress), TransitionKind::kSkipped);
  EXPECT_EQ(dispatch::ClassifyTransition(TripStatus::kCompleted, TripStatus::kStarted), TransitionKind::kBackward);
}

TEST(TripModelTest, ApplyUpdateTouchesOnlyGivenFields) {
  dispatch::Trip trip;
  trip.pickup = "A";
  trip.dropoff = "B";
  trip.driver_id = "7";

  dispatch::TripUpdate update;
  update.dropoff = "C";
  update.status = dispatch::TripStatus::kStarted;
  dispatch::ApplyUpdate(trip, update);
  EXPECT_EQ(trip.pickup, "A");
  EXPECT_EQ(trip.dropoff, "C");
  EXPECT_EQ(trip.status, dispatch::TripStatus::kStarted);
  EXPECT_EQ(trip.driver_id, "7");

  dispatch::TripUpdate unassign;
  unassign.assign_driver = true;
  EXPECT_FALSE(unassign.Empty());
  dispatch::ApplyUpdate(trip, unassign);
  EXPECT_FALSE(trip.driver_id.has_value());
  EXPECT_TRUE(dispatch::TripUpdate{}.Empty());
}

TEST(TripModelTest, ParticipationAndOpenness) {
  dispatch::Trip trip;
  trip.rider_id = "1";
  EXPECT_TRUE(dispatch::IsParticipant(trip, "1"));
  EXPECT_FALSE(dispatch::IsParticipant(trip, "2"));
  trip.driver_id = "2";
  EXPECT_TRUE(dispatch::IsParticipant(trip, "2"));
  EXPECT_TRUE(dispatch::IsOpen(trip));
  trip.status = dispatch::TripStatus::kCompleted;
  EXPECT_FALSE(dispatch::IsOpen(trip));
}

TEST(TripModelTest, GeneratesVersionFourUuids) {
  const std::regex pattern("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    auto id = dispatch::GenerateTripId();
    EXPECT_TRUE(std::regex_match(id, pattern)) << id;
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 100u);
}

TEST(TripModelTest, JsonNestsResolvedParticipants) {
  dispatch::TripRecord record;
  record.trip.id = "trip-1";
  record.trip.pickup = "123 Street Home Address";
  record.trip.dropoff = "456 Street Destination";
  record.trip.rider_id = "1";
  record.trip.driver_id = "9";
  record.rider = dispatch::MakeRider("1", "+8201");

  auto json = dispatch::TripToJson(record);
  EXPECT_EQ(json["id"], "trip-1");
  EXPECT_EQ(json["status"], "REQUESTED");
  EXPECT_EQ(json["rider"]["id"], "1");
  EXPECT_EQ(json["rider"]["phone_number"], "+8201");
  EXPECT_EQ(json["driver"], nlohmann::json({{"id", "9"}}));
  EXPECT_TRUE(json.contains("created"));
  EXPECT_TRUE(json.contains("updated"));

  record.trip.driver_id.reset();
  EXPECT_TRUE(dispatch::TripToJson(record)["driver"].is_null());
}
