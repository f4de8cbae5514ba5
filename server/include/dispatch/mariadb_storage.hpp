/*
 * 설명: MariaDB에 주체/운행 레코드를 저장하는 저장소 어댑터를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/001_dispatch.sql
 * 테스트: server/tests/it/mariadb_storage_it_test.cpp
 */
#pragma once

#include <functional>
#include <memory>

#include <mariadb/mysql.h>

#include "dispatch/db_client.hpp"
#include "dispatch/storage.hpp"

namespace dispatch {

class MariaDbStorage : public StorageService {
 public:
  explicit MariaDbStorage(std::shared_ptr<MariaDbClient> db_client);

  std::optional<Principal> GetPrincipal(const std::string& id) override;
  Trip CreateTrip(const TripDraft& draft) override;
  std::optional<Trip> GetTrip(const std::string& id) override;
  std::optional<Trip> UpdateTrip(const std::string& id, const TripUpdate& update) override;
  std::vector<Trip> ListOpenTrips(const std::string& principal_id) override;

  void UpsertPrincipal(const Principal& principal);
  void ClearAll();

 private:
  template <typename Fn>
  auto Guard(const char* operation, Fn&& fn) -> decltype(fn());

  std::optional<Trip> SelectTrip(MYSQL* conn, const std::string& id, bool for_update) const;
  void WriteTrip(MYSQL* conn, const Trip& trip) const;
  Trip BuildTrip(MYSQL_ROW row) const;
  Principal BuildPrincipal(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace dispatch
