/*
 * 설명: 인메모리 저장소와 주체 시드 파일 로딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/trip_state_machine_test.cpp
 */
#include "dispatch/memory_storage.hpp"

#include <fstream>

namespace dispatch {

void InMemoryStorage::MaybeFail(const std::string& operation) const {
  if (failure_injector_ && failure_injector_(operation)) {
    throw StorageError("주입된 저장소 일시 오류: " + operation, true);
  }
}

std::optional<Principal> InMemoryStorage::GetPrincipal(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("get_principal");
  auto it = principals_.find(id);
  if (it == principals_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Trip InMemoryStorage::CreateTrip(const TripDraft& draft) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("create_trip");
  Trip trip;
  trip.id = GenerateTripId();
  trip.pickup = draft.pickup;
  trip.dropoff = draft.dropoff;
  trip.status = TripStatus::kRequested;
  trip.rider_id = draft.rider_id;
  trip.created = std::chrono::system_clock::now();
  trip.updated = trip.created;
  trips_[trip.id] = trip;
  trip_order_[next_sequence_++] = trip.id;
  return trip;
}

std::optional<Trip> InMemoryStorage::GetTrip(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("get_trip");
  auto it = trips_.find(id);
  if (it == trips_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Trip> InMemoryStorage::UpdateTrip(const std::string& id, const TripUpdate& update) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("update_trip");
  auto it = trips_.find(id);
  if (it == trips_.end()) {
    return std::nullopt;
  }
  ApplyUpdate(it->second, update);
  it->second.updated = std::chrono::system_clock::now();
  return it->second;
}

std::vector<Trip> InMemoryStorage::ListOpenTrips(const std::string& principal_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  MaybeFail("list_open_trips");
  std::vector<Trip> result;
  for (const auto& [sequence, trip_id] : trip_order_) {
    const auto& trip = trips_.at(trip_id);
    if (IsOpen(trip) && IsParticipant(trip, principal_id)) {
      result.push_back(trip);
    }
  }
  return result;
}

void InMemoryStorage::PutPrincipal(const Principal& principal) {
  std::lock_guard<std::mutex> lock(mutex_);
  principals_[principal.id] = principal;
}

void InMemoryStorage::PutTrip(const Trip& trip) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (trips_.find(trip.id) == trips_.end()) {
    trip_order_[next_sequence_++] = trip.id;
  }
  trips_[trip.id] = trip;
}

std::size_t InMemoryStorage::LoadPrincipalsFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("주체 파일을 열 수 없습니다: " + path);
  }
  auto json = nlohmann::json::parse(in);
  if (!json.is_array()) {
    throw std::runtime_error("주체 파일은 JSON 배열이어야 합니다: " + path);
  }
  std::size_t loaded = 0;
  for (const auto& entry : json) {
    auto principal = PrincipalFromJson(entry);
    if (!principal) {
      throw std::runtime_error("주체 항목 형식이 올바르지 않습니다: " + entry.dump());
    }
    PutPrincipal(*principal);
    ++loaded;
  }
  return loaded;
}

std::size_t InMemoryStorage::TripCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trips_.size();
}

void InMemoryStorage::SetFailureInjector(const std::function<bool(const std::string&)>& injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_injector_ = injector;
}

}  // namespace dispatch
