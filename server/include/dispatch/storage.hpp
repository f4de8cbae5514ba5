/*
 * 설명: 주체/운행 레코드를 영속화하는 외부 저장소 서비스의 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/trip_state_machine_test.cpp, server/tests/it/mariadb_storage_it_test.cpp
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "dispatch/principal.hpp"
#include "dispatch/trip.hpp"

namespace dispatch {

// 저장소 호출의 일시 장애. 재시도 여부는 호출자가 결정한다.
class StorageError : public std::runtime_error {
 public:
  StorageError(const std::string& message, bool retryable) : std::runtime_error(message), retryable(retryable) {}
  bool retryable;
};

class StorageService {
 public:
  virtual ~StorageService() = default;

  virtual std::optional<Principal> GetPrincipal(const std::string& id) = 0;
  virtual Trip CreateTrip(const TripDraft& draft) = 0;
  virtual std::optional<Trip> GetTrip(const std::string& id) = 0;
  virtual std::optional<Trip> UpdateTrip(const std::string& id, const TripUpdate& update) = 0;
  // 주체가 rider 또는 driver로 참여 중인 미완료 운행.
  virtual std::vector<Trip> ListOpenTrips(const std::string& principal_id) = 0;
};

}  // namespace dispatch
