/*
 * 설명: 운행(Trip) 레코드, 상태 열거형, 부분 갱신 요청과 상태 전이 분류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/model_test.cpp, server/tests/unit/trip_state_machine_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "dispatch/principal.hpp"

namespace dispatch {

// 선언 순서가 곧 진행 순서다.
enum class TripStatus { kRequested = 0, kStarted = 1, kInProgress = 2, kCompleted = 3 };

enum class TransitionKind { kUnchanged, kNext, kSkipped, kBackward };

struct Trip {
  std::string id;
  std::string pickup;
  std::string dropoff;
  TripStatus status{TripStatus::kRequested};
  std::optional<std::string> rider_id;
  std::optional<std::string> driver_id;
  std::chrono::system_clock::time_point created;
  std::chrono::system_clock::time_point updated;
};

struct TripDraft {
  std::string pickup;
  std::string dropoff;
  std::optional<std::string> rider_id;
};

struct TripUpdate {
  std::optional<std::string> pickup;
  std::optional<std::string> dropoff;
  std::optional<TripStatus> status;
  // assign_driver가 true일 때만 driver_id가 의미를 가진다. nullopt는 배정 해제.
  bool assign_driver{false};
  std::optional<std::string> driver_id;

  bool Empty() const { return !pickup && !dropoff && !status && !assign_driver; }
};

// 응답/브로드캐스트용으로 rider/driver를 풀어 둔 레코드.
struct TripRecord {
  Trip trip;
  std::optional<Principal> rider;
  std::optional<Principal> driver;
};

std::string_view TripStatusName(TripStatus status);
std::optional<TripStatus> ParseTripStatus(std::string_view name);
TransitionKind ClassifyTransition(TripStatus from, TripStatus to);
bool IsOpen(const Trip& trip);
bool IsParticipant(const Trip& trip, const std::string& principal_id);
void ApplyUpdate(Trip& trip, const TripUpdate& update);

std::string GenerateTripId();

nlohmann::json TripToJson(const TripRecord& record);

}  // namespace dispatch
