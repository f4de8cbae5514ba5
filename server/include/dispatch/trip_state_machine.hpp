/*
 * 설명: 운행 생성/갱신, 상태 전이 검증, 참여자 권한 검사와 운행별 쓰기 직렬화를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/trip_state_machine_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "dispatch/observability.hpp"
#include "dispatch/principal.hpp"
#include "dispatch/storage.hpp"
#include "dispatch/trip.hpp"

namespace dispatch {

struct TripPolicy {
  bool reject_backward_transitions{true};
  bool enforce_participants{true};
};

class TripStateMachine {
 public:
  TripStateMachine(std::shared_ptr<StorageService> storage, std::shared_ptr<Observability> observability,
                   TripPolicy policy = {});

  // rider_id가 없으면 요청한 주체가 rider가 된다.
  std::optional<TripRecord> Create(const Principal& actor, const std::string& pickup, const std::string& dropoff,
                                   const std::optional<std::string>& rider_id, std::string& error_code,
                                   std::string& error_message);
  std::optional<TripRecord> Update(const Principal& actor, const std::string& trip_id, const TripUpdate& update,
                                   std::string& error_code, std::string& error_message);
  // 저장소 장애 시 로그를 남기고 빈 목록을 반환한다.
  std::vector<Trip> OpenTripsFor(const std::string& principal_id);

  std::size_t LockTableSize() const;

 private:
  std::shared_ptr<std::mutex> LockFor(const std::string& trip_id);
  bool Authorize(const Principal& actor, const Trip& trip, const TripUpdate& update, std::string& error_code,
                 std::string& error_message) const;
  bool CheckTransition(const Trip& trip, TripStatus next, std::string& error_code, std::string& error_message) const;
  std::optional<Principal> Resolve(const std::optional<std::string>& id);
  void ReportStorageFailure(const std::string& operation, const StorageError& error, std::string& error_code,
                            std::string& error_message) const;

  std::shared_ptr<StorageService> storage_;
  std::shared_ptr<Observability> observability_;
  TripPolicy policy_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> trip_locks_;
  mutable std::mutex locks_mutex_;
};

}  // namespace dispatch
