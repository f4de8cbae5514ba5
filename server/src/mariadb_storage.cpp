/*
 * 설명: MariaDB 기반 주체 조회와 운행 생성/조회/갱신을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/001_dispatch.sql
 * 테스트: server/tests/it/mariadb_storage_it_test.cpp
 */
#include "dispatch/mariadb_storage.hpp"

#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

namespace dispatch {
namespace {
constexpr const char* kTripColumns = "id, pickup, dropoff, status, rider_id, driver_id, created, updated";

std::string ToDbTimestamp(std::chrono::system_clock::time_point tp) {
  auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
  auto tt = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
  return oss.str();
}

std::chrono::system_clock::time_point FromDbTimestamp(const char* text) {
  if (!text) {
    return {};
  }
  std::tm tm{};
  long micros = 0;
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.peek() == '.') {
    iss.get();
    std::string fraction;
    iss >> fraction;
    fraction.resize(6, '0');
    micros = std::stol(fraction);
  }
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  return tp + std::chrono::microseconds(micros);
}

using ResultPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

std::optional<std::string> OptionalColumn(const char* value) {
  if (!value) {
    return std::nullopt;
  }
  return std::string{value};
}
}  // namespace

MariaDbStorage::MariaDbStorage(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

template <typename Fn>
auto MariaDbStorage::Guard(const char* operation, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const DbException& ex) {
    throw StorageError(std::string(operation) + ": " + ex.what(), ex.retryable);
  }
}

std::optional<Principal> MariaDbStorage::GetPrincipal(const std::string& id) {
  return Guard("get_principal", [&]() {
    std::optional<Principal> result;
    db_client_->WithConnection([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT id, phone_number, first_name, last_name, type, is_staff, is_active FROM principals WHERE id = '"
          << db_client_->Escape(conn, id) << "';";
      db_client_->Execute(conn, oss.str(), "주체 조회 실패");
      ResultPtr res(mysql_store_result(conn), &mysql_free_result);
      if (!res) {
        db_client_->RaiseError(conn, "주체 조회 결과 없음");
      }
      MYSQL_ROW row = mysql_fetch_row(res.get());
      if (row) {
        result = BuildPrincipal(row);
      }
    });
    return result;
  });
}

Trip MariaDbStorage::CreateTrip(const TripDraft& draft) {
  return Guard("create_trip", [&]() {
    Trip trip;
    trip.id = GenerateTripId();
    trip.pickup = draft.pickup;
    trip.dropoff = draft.dropoff;
    trip.status = TripStatus::kRequested;
    trip.rider_id = draft.rider_id;
    trip.created = std::chrono::system_clock::now();
    trip.updated = trip.created;
    db_client_->InTransaction([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "INSERT INTO trips(" << kTripColumns << ") VALUES('" << db_client_->Escape(conn, trip.id) << "', '"
          << db_client_->Escape(conn, trip.pickup) << "', '" << db_client_->Escape(conn, trip.dropoff) << "', '"
          << TripStatusName(trip.status) << "', " << db_client_->QuoteOrNull(conn, trip.rider_id) << ", NULL, '"
          << ToDbTimestamp(trip.created) << "', '" << ToDbTimestamp(trip.updated) << "');";
      db_client_->Execute(conn, oss.str(), "운행 생성 실패");
      return true;
    });
    return trip;
  });
}

std::optional<Trip> MariaDbStorage::GetTrip(const std::string& id) {
  return Guard("get_trip", [&]() {
    std::optional<Trip> result;
    db_client_->WithConnection([&](MYSQL* conn) { result = SelectTrip(conn, id, false); });
    return result;
  });
}

std::optional<Trip> MariaDbStorage::UpdateTrip(const std::string& id, const TripUpdate& update) {
  return Guard("update_trip", [&]() {
    std::optional<Trip> result;
    db_client_->InTransaction([&](MYSQL* conn) {
      result = SelectTrip(conn, id, true);
      if (!result) {
        return false;
      }
      ApplyUpdate(*result, update);
      result->updated = std::chrono::system_clock::now();
      WriteTrip(conn, *result);
      return true;
    });
    return result;
  });
}

std::vector<Trip> MariaDbStorage::ListOpenTrips(const std::string& principal_id) {
  return Guard("list_open_trips", [&]() {
    std::vector<Trip> trips;
    db_client_->WithConnection([&](MYSQL* conn) {
      trips.clear();
      auto escaped = db_client_->Escape(conn, principal_id);
      std::ostringstream oss;
      oss << "SELECT " << kTripColumns << " FROM trips WHERE (rider_id = '" << escaped << "' OR driver_id = '"
          << escaped << "') AND status <> 'COMPLETED' ORDER BY created ASC;";
      db_client_->Execute(conn, oss.str(), "미완료 운행 조회 실패");
      ResultPtr res(mysql_store_result(conn), &mysql_free_result);
      if (!res) {
        db_client_->RaiseError(conn, "미완료 운행 결과 없음");
      }
      MYSQL_ROW row;
      while ((row = mysql_fetch_row(res.get())) != nullptr) {
        trips.push_back(BuildTrip(row));
      }
    });
    return trips;
  });
}

void MariaDbStorage::UpsertPrincipal(const Principal& principal) {
  Guard("upsert_principal", [&]() {
    db_client_->InTransaction([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "INSERT INTO principals(id, phone_number, first_name, last_name, type, is_staff, is_active) VALUES('"
          << db_client_->Escape(conn, principal.id) << "', '" << db_client_->Escape(conn, principal.phone_number)
          << "', '" << db_client_->Escape(conn, principal.first_name) << "', '"
          << db_client_->Escape(conn, principal.last_name) << "', '" << RoleName(principal.role) << "', "
          << (principal.is_staff ? 1 : 0) << ", " << (principal.is_active ? 1 : 0)
          << ") ON DUPLICATE KEY UPDATE phone_number = VALUES(phone_number), first_name = VALUES(first_name), "
             "last_name = VALUES(last_name), type = VALUES(type), is_staff = VALUES(is_staff), "
             "is_active = VALUES(is_active);";
      db_client_->Execute(conn, oss.str(), "주체 저장 실패");
      return true;
    });
  });
}

void MariaDbStorage::ClearAll() {
  Guard("clear_all", [&]() {
    db_client_->InTransaction([&](MYSQL* conn) {
      db_client_->Execute(conn, "DELETE FROM trips;", "운행 초기화 실패");
      db_client_->Execute(conn, "DELETE FROM principals;", "주체 초기화 실패");
      return true;
    });
  });
}

std::optional<Trip> MariaDbStorage::SelectTrip(MYSQL* conn, const std::string& id, bool for_update) const {
  std::ostringstream oss;
  oss << "SELECT " << kTripColumns << " FROM trips WHERE id = '" << db_client_->Escape(conn, id) << "'"
      << (for_update ? " FOR UPDATE;" : ";");
  db_client_->Execute(conn, oss.str(), "운행 조회 실패");
  ResultPtr res(mysql_store_result(conn), &mysql_free_result);
  if (!res) {
    db_client_->RaiseError(conn, "운행 조회 결과 없음");
  }
  std::optional<Trip> trip;
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (row) {
    trip = BuildTrip(row);
  }
  return trip;
}

void MariaDbStorage::WriteTrip(MYSQL* conn, const Trip& trip) const {
  std::ostringstream oss;
  oss << "UPDATE trips SET pickup = '" << db_client_->Escape(conn, trip.pickup) << "', dropoff = '"
      << db_client_->Escape(conn, trip.dropoff) << "', status = '" << TripStatusName(trip.status)
      << "', driver_id = " << db_client_->QuoteOrNull(conn, trip.driver_id) << ", updated = '"
      << ToDbTimestamp(trip.updated) << "' WHERE id = '" << db_client_->Escape(conn, trip.id) << "';";
  db_client_->Execute(conn, oss.str(), "운행 갱신 실패");
}

Trip MariaDbStorage::BuildTrip(MYSQL_ROW row) const {
  Trip trip;
  trip.id = row[0] ? row[0] : "";
  trip.pickup = row[1] ? row[1] : "";
  trip.dropoff = row[2] ? row[2] : "";
  auto status = ParseTripStatus(row[3] ? row[3] : "");
  if (!status) {
    throw DbException(std::string("알 수 없는 운행 상태: ") + (row[3] ? row[3] : "NULL"), 0, false);
  }
  trip.status = *status;
  trip.rider_id = OptionalColumn(row[4]);
  trip.driver_id = OptionalColumn(row[5]);
  trip.created = FromDbTimestamp(row[6]);
  trip.updated = FromDbTimestamp(row[7]);
  return trip;
}

Principal MariaDbStorage::BuildPrincipal(MYSQL_ROW row) const {
  auto role = ParseRole(row[4] ? row[4] : "");
  if (!role) {
    throw DbException(std::string("알 수 없는 주체 유형: ") + (row[4] ? row[4] : "NULL"), 0, false);
  }
  Principal principal;
  principal.id = row[0] ? row[0] : "";
  principal.phone_number = row[1] ? row[1] : "";
  principal.first_name = row[2] ? row[2] : "";
  principal.last_name = row[3] ? row[3] : "";
  principal.role = *role;
  principal.is_staff = row[5] && std::string(row[5]) == "1";
  principal.is_active = row[6] && std::string(row[6]) == "1";
  return principal;
}

}  // namespace dispatch
