/*
 * 설명: 운행 상태 변환, 전이 분류, 식별자 생성과 JSON 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/model_test.cpp
 */
#include "dispatch/trip.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

#include "dispatch/api_response.hpp"

namespace dispatch {
namespace {
// 참조된 주체를 찾지 못한 경우에도 식별자는 노출한다.
nlohmann::json ParticipantJson(const std::optional<Principal>& principal, const std::optional<std::string>& id) {
  if (principal) {
    return PrincipalToJson(*principal);
  }
  if (id) {
    return {{"id", *id}};
  }
  return nullptr;
}
}  // namespace

std::string_view TripStatusName(TripStatus status) {
  switch (status) {
    case TripStatus::kStarted:
      return "STARTED";
    case TripStatus::kInProgress:
      return "IN_PROGRESS";
    case TripStatus::kCompleted:
      return "COMPLETED";
    case TripStatus::kRequested:
      break;
  }
  return "REQUESTED";
}

std::optional<TripStatus> ParseTripStatus(std::string_view name) {
  if (name == "REQUESTED") {
    return TripStatus::kRequested;
  }
  if (name == "STARTED") {
    return TripStatus::kStarted;
  }
  if (name == "IN_PROGRESS") {
    return TripStatus::kInProgress;
  }
  if (name == "COMPLETED") {
    return TripStatus::kCompleted;
  }
  return std::nullopt;
}

TransitionKind ClassifyTransition(TripStatus from, TripStatus to) {
  const int delta = static_cast<int>(to) - static_cast<int>(from);
  if (delta == 0) {
    return TransitionKind::kUnchanged;
  }
  if (delta == 1) {
    return TransitionKind::kNext;
  }
  return delta > 1 ? TransitionKind::kSkipped : TransitionKind::kBackward;
}

bool IsOpen(const Trip& trip) { return trip.status != TripStatus::kCompleted; }

bool IsParticipant(const Trip& trip, const std::string& principal_id) {
  return (trip.rider_id && *trip.rider_id == principal_id) || (trip.driver_id && *trip.driver_id == principal_id);
}

void ApplyUpdate(Trip& trip, const TripUpdate& update) {
  if (update.pickup) {
    trip.pickup = *update.pickup;
  }
  if (update.dropoff) {
    trip.dropoff = *update.dropoff;
  }
  if (update.status) {
    trip.status = *update.status;
  }
  if (update.assign_driver) {
    trip.driver_id = update.driver_id;
  }
}

std::string GenerateTripId() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("운행 식별자 난수 생성 실패");
  }
  // RFC 4122 version 4, variant 10xx
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
  std::ostringstream oss;
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      oss << '-';
    }
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

nlohmann::json TripToJson(const TripRecord& record) {
  const auto& trip = record.trip;
  nlohmann::json json{{"id", trip.id},
                      {"pickup", trip.pickup},
                      {"dropoff", trip.dropoff},
                      {"status", TripStatusName(trip.status)},
                      {"created", ToIsoString(trip.created)},
                      {"updated", ToIsoString(trip.updated)}};
  json["rider"] = ParticipantJson(record.rider, trip.rider_id);
  json["driver"] = ParticipantJson(record.driver, trip.driver_id);
  return json;
}

}  // namespace dispatch
