#include <atomic>
#include <cstdlib>
#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "dispatch/db_client.hpp"
#include "dispatch/mariadb_storage.hpp"
#include "dispatch/trip_state_machine.hpp"

namespace {

dispatch::DbConfig TestDbConfig() {
  dispatch::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "dispatch_db";
  return cfg;
}

// server/db/001_dispatch.sql이 적용된 DB를 전제로 한다.
class MariaDbStorageIt : public ::testing::Test {
 protected:
  void SetUp() override {
    client_ = std::make_shared<dispatch::MariaDbClient>(TestDbConfig());
    storage_ = std::make_shared<dispatch::MariaDbStorage>(client_);
    storage_->ClearAll();
    storage_->UpsertPrincipal(dispatch::MakeRider("1", "+8201"));
    storage_->UpsertPrincipal(dispatch::MakeDriver("2", "+8202"));
  }

  std::shared_ptr<dispatch::MariaDbClient> client_;
  std::shared_ptr<dispatch::MariaDbStorage> storage_;
};

}  // namespace

TEST_F(MariaDbStorageIt, PrincipalRoundTrip) {
  auto driver = storage_->GetPrincipal("2");
  ASSERT_TRUE(driver.has_value());
  EXPECT_EQ(driver->role, dispatch::Role::kDriver);
  EXPECT_EQ(driver->phone_number, "+8202");
  EXPECT_TRUE(driver->is_active);
  EXPECT_FALSE(storage_->GetPrincipal("404").has_value());

  auto inactive = dispatch::MakeRider("1", "+8201");
  inactive.is_active = false;
  storage_->UpsertPrincipal(inactive);
  EXPECT_FALSE(storage_->GetPrincipal("1")->is_active);
}

TEST_F(MariaDbStorageIt, CreateUpdateAndListOpenTrips) {
  auto trip = storage_->CreateTrip(dispatch::TripDraft{"123 Street Home Address", "456 Street Destination", "1"});
  EXPECT_EQ(trip.id.size(), 36u);
  EXPECT_EQ(trip.status, dispatch::TripStatus::kRequested);

  auto fetched = storage_->GetTrip(trip.id);
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ(fetched->pickup, "123 Street Home Address");
  EXPECT_EQ(fetched->rider_id, "1");
  EXPECT_FALSE(fetched->driver_id.has_value());

  dispatch::TripUpdate update;
  update.status = dispatch::TripStatus::kStarted;
  update.assign_driver = true;
  update.driver_id = "2";
  auto updated = storage_->UpdateTrip(trip.id, update);
  ASSERT_TRUE(updated.has_value());
  EXPECT_EQ(updated->status, dispatch::TripStatus::kStarted);
  EXPECT_EQ(updated->driver_id, "2");
  EXPECT_GE(updated->updated, updated->created);

  ASSERT_EQ(storage_->ListOpenTrips("2").size(), 1u);
  dispatch::TripUpdate complete;
  complete.status = dispatch::TripStatus::kCompleted;
  ASSERT_TRUE(storage_->UpdateTrip(trip.id, complete).has_value());
  EXPECT_TRUE(storage_->ListOpenTrips("2").empty());
  EXPECT_FALSE(storage_->UpdateTrip("00000000-0000-4000-8000-000000000000", complete).has_value());
}

TEST_F(MariaDbStorageIt, TransientFailuresAreRetriedThenSurfaced) {
  client_->SetTransientInjector([](std::size_t attempt) { return attempt == 1; });
  EXPECT_TRUE(storage_->GetPrincipal("1").has_value());

  client_->SetTransientInjector([](std::size_t) { return true; });
  try {
    storage_->GetPrincipal("1");
    FAIL() << "StorageError가 발생해야 합니다";
  } catch (const dispatch::StorageError& ex) {
    EXPECT_TRUE(ex.retryable);
  }
  client_->SetTransientInjector(nullptr);
}

TEST_F(MariaDbStorageIt, ConcurrentUpdatesDoNotLoseWrites) {
  auto trip = storage_->CreateTrip(dispatch::TripDraft{"A", "B", "1"});
  auto observability = std::make_shared<dispatch::Observability>(dispatch::LogLevel::kError);
  dispatch::TripStateMachine machine(storage_, observability);
  auto rider = dispatch::MakeRider("1", "+8201");

  std::vector<std::thread> threads;
  std::atomic<int> succeeded{0};
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      std::string code;
      std::string message;
      dispatch::TripUpdate update;
      update.dropoff = "dest-" + std::to_string(t);
      if (machine.Update(rider, trip.id, update, code, message)) {
        succeeded.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(succeeded.load(), 4);
  auto stored = storage_->GetTrip(trip.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->dropoff.rfind("dest-", 0), 0u);
}
