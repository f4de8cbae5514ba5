/*
 * 설명: 운행 상태 기계. 저장소 호출을 감싸 오류 코드로 변환하고 이상 전이를 로그로 남긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/trip_state_machine_test.cpp
 */
#include "dispatch/trip_state_machine.hpp"

namespace dispatch {

TripStateMachine::TripStateMachine(std::shared_ptr<StorageService> storage,
                                   std::shared_ptr<Observability> observability, TripPolicy policy)
    : storage_(std::move(storage)), observability_(std::move(observability)), policy_(policy) {}

std::optional<TripRecord> TripStateMachine::Create(const Principal& actor, const std::string& pickup,
                                                   const std::string& dropoff,
                                                   const std::optional<std::string>& rider_id,
                                                   std::string& error_code, std::string& error_message) {
  if (pickup.empty() || dropoff.empty()) {
    error_code = "bad_request";
    error_message = "pickup과 dropoff가 필요합니다";
    return std::nullopt;
  }
  const std::string rider = rider_id.value_or(actor.id);
  if (policy_.enforce_participants && actor.role != Role::kOwner && rider != actor.id) {
    error_code = "forbidden";
    error_message = "다른 rider의 운행을 생성할 수 없습니다";
    return std::nullopt;
  }

  try {
    std::optional<Principal> rider_principal = rider == actor.id ? std::optional<Principal>{actor}
                                                                 : storage_->GetPrincipal(rider);
    if (!rider_principal) {
      error_code = "rider_not_found";
      error_message = "rider를 찾을 수 없습니다";
      return std::nullopt;
    }
    auto trip = storage_->CreateTrip(TripDraft{pickup, dropoff, rider});
    observability_->Event(LogLevel::kInfo, "trip.created",
                          {{"tripId", trip.id}, {"principalId", actor.id}, {"riderId", rider}});
    return TripRecord{std::move(trip), std::move(rider_principal), std::nullopt};
  } catch (const StorageError& ex) {
    ReportStorageFailure("create_trip", ex, error_code, error_message);
    return std::nullopt;
  }
}

std::optional<TripRecord> TripStateMachine::Update(const Principal& actor, const std::string& trip_id,
                                                   const TripUpdate& update, std::string& error_code,
                                                   std::string& error_message) {
  if (trip_id.empty()) {
    error_code = "bad_request";
    error_message = "id가 필요합니다";
    return std::nullopt;
  }
  if (update.Empty()) {
    error_code = "bad_request";
    error_message = "변경할 필드가 없습니다";
    return std::nullopt;
  }
  if ((update.pickup && update.pickup->empty()) || (update.dropoff && update.dropoff->empty())) {
    error_code = "bad_request";
    error_message = "pickup/dropoff는 비어 있을 수 없습니다";
    return std::nullopt;
  }

  auto trip_lock = LockFor(trip_id);
  std::lock_guard<std::mutex> guard(*trip_lock);
  try {
    auto current = storage_->GetTrip(trip_id);
    if (!current) {
      error_code = "trip_not_found";
      error_message = "운행을 찾을 수 없습니다";
      return std::nullopt;
    }
    if (!Authorize(actor, *current, update, error_code, error_message)) {
      return std::nullopt;
    }
    if (update.assign_driver && update.driver_id) {
      auto driver = *update.driver_id == actor.id ? std::optional<Principal>{actor}
                                                  : storage_->GetPrincipal(*update.driver_id);
      if (!driver) {
        error_code = "driver_not_found";
        error_message = "driver를 찾을 수 없습니다";
        return std::nullopt;
      }
      if (driver->role != Role::kDriver) {
        error_code = "invalid_driver";
        error_message = "DRIVER 역할만 배정할 수 있습니다";
        return std::nullopt;
      }
    }
    if (update.status && !CheckTransition(*current, *update.status, error_code, error_message)) {
      return std::nullopt;
    }

    auto updated = storage_->UpdateTrip(trip_id, update);
    if (!updated) {
      error_code = "trip_not_found";
      error_message = "운행을 찾을 수 없습니다";
      return std::nullopt;
    }
    observability_->Event(LogLevel::kInfo, "trip.updated",
                          {{"tripId", trip_id},
                           {"principalId", actor.id},
                           {"from", TripStatusName(current->status)},
                           {"to", TripStatusName(updated->status)}});
    TripRecord record{*updated, Resolve(updated->rider_id), Resolve(updated->driver_id)};
    return record;
  } catch (const StorageError& ex) {
    ReportStorageFailure("update_trip", ex, error_code, error_message);
    return std::nullopt;
  }
}

std::vector<Trip> TripStateMachine::OpenTripsFor(const std::string& principal_id) {
  try {
    return storage_->ListOpenTrips(principal_id);
  } catch (const StorageError& ex) {
    observability_->Event(LogLevel::kError, "storage.failure",
                          {{"operation", "list_open_trips"}, {"principalId", principal_id}, {"error", ex.what()}});
    return {};
  }
}

std::size_t TripStateMachine::LockTableSize() const {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  return trip_locks_.size();
}

std::shared_ptr<std::mutex> TripStateMachine::LockFor(const std::string& trip_id) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  for (auto it = trip_locks_.begin(); it != trip_locks_.end();) {
    if (it->second.expired() && it->first != trip_id) {
      it = trip_locks_.erase(it);
    } else {
      ++it;
    }
  }
  auto& slot = trip_locks_[trip_id];
  auto mutex = slot.lock();
  if (!mutex) {
    mutex = std::make_shared<std::mutex>();
    slot = mutex;
  }
  return mutex;
}

bool TripStateMachine::Authorize(const Principal& actor, const Trip& trip, const TripUpdate& update,
                                 std::string& error_code, std::string& error_message) const {
  if (!policy_.enforce_participants || actor.role == Role::kOwner) {
    return true;
  }
  const bool changes_driver = update.assign_driver && update.driver_id != trip.driver_id;
  const bool claims_open_trip = actor.role == Role::kDriver && !trip.driver_id && update.assign_driver &&
                                update.driver_id && *update.driver_id == actor.id;
  if (IsParticipant(trip, actor.id)) {
    if (changes_driver && !claims_open_trip) {
      error_code = "forbidden";
      error_message = "다른 driver를 배정할 수 없습니다";
      return false;
    }
    return true;
  }
  if (claims_open_trip) {
    return true;
  }
  error_code = "forbidden";
  error_message = "운행 참여자가 아닙니다";
  return false;
}

bool TripStateMachine::CheckTransition(const Trip& trip, TripStatus next, std::string& error_code,
                                       std::string& error_message) const {
  auto kind = ClassifyTransition(trip.status, next);
  if (kind == TransitionKind::kUnchanged || kind == TransitionKind::kNext) {
    return true;
  }
  nlohmann::json fields{{"tripId", trip.id}, {"from", TripStatusName(trip.status)}, {"to", TripStatusName(next)}};
  if (kind == TransitionKind::kSkipped) {
    observability_->Event(LogLevel::kWarn, "trip.transition_skipped", fields);
    return true;
  }
  if (policy_.reject_backward_transitions) {
    observability_->Event(LogLevel::kWarn, "trip.transition_rejected", fields);
    error_code = "invalid_transition";
    error_message = std::string("상태를 되돌릴 수 없습니다: ") + std::string(TripStatusName(trip.status)) + " -> " +
                    std::string(TripStatusName(next));
    return false;
  }
  observability_->Event(LogLevel::kWarn, "trip.transition_backward", fields);
  return true;
}

std::optional<Principal> TripStateMachine::Resolve(const std::optional<std::string>& id) {
  if (!id) {
    return std::nullopt;
  }
  // 갱신은 이미 커밋되었으므로 조회 실패 시 식별자만 노출한다.
  try {
    return storage_->GetPrincipal(*id);
  } catch (const StorageError& ex) {
    observability_->Event(LogLevel::kWarn, "storage.failure", {{"operation", "get_principal"}, {"error", ex.what()}});
    return std::nullopt;
  }
}

void TripStateMachine::ReportStorageFailure(const std::string& operation, const StorageError& error,
                                            std::string& error_code, std::string& error_message) const {
  observability_->Event(LogLevel::kError, "storage.failure", {{"operation", operation}, {"error", error.what()}});
  error_code = "storage_unavailable";
  error_message = "저장소를 일시적으로 사용할 수 없습니다";
}

}  // namespace dispatch
