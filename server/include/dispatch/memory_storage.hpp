/*
 * 설명: 단일 프로세스 배포와 테스트용 인메모리 저장소 구현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/trip_state_machine_test.cpp, server/tests/e2e/dispatch_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "dispatch/storage.hpp"

namespace dispatch {

class InMemoryStorage : public StorageService {
 public:
  InMemoryStorage() = default;

  std::optional<Principal> GetPrincipal(const std::string& id) override;
  Trip CreateTrip(const TripDraft& draft) override;
  std::optional<Trip> GetTrip(const std::string& id) override;
  std::optional<Trip> UpdateTrip(const std::string& id, const TripUpdate& update) override;
  std::vector<Trip> ListOpenTrips(const std::string& principal_id) override;

  void PutPrincipal(const Principal& principal);
  // 테스트 픽스처에서 특정 상태의 운행을 직접 심을 때 사용한다.
  void PutTrip(const Trip& trip);
  std::size_t LoadPrincipalsFile(const std::string& path);
  std::size_t TripCount() const;

  // true를 반환하면 해당 호출은 재시도 가능한 StorageError로 실패한다.
  void SetFailureInjector(const std::function<bool(const std::string&)>& injector);

 private:
  void MaybeFail(const std::string& operation) const;

  std::unordered_map<std::string, Principal> principals_;
  // ListOpenTrips는 삽입 순번 순서로 반환한다.
  std::unordered_map<std::string, Trip> trips_;
  std::map<std::size_t, std::string> trip_order_;
  std::size_t next_sequence_{1};
  std::function<bool(const std::string&)> failure_injector_;
  mutable std::mutex mutex_;
};

}  // namespace dispatch
