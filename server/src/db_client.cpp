/*
 * 설명: MariaDB 연결 수명, 재시도 루프와 쿼리 헬퍼를 구현한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_storage_it_test.cpp
 */
#include "dispatch/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace dispatch {
namespace {
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

void MariaDbClient::ConnectionCloser::operator()(MYSQL* conn) const { mysql_close(conn); }

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {
  if (config_.max_attempts == 0) {
    config_.max_attempts = 1;
  }
}

MariaDbClient::ConnectionHandle MariaDbClient::Open() const {
  ConnectionHandle handle(mysql_init(nullptr));
  if (!handle) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  MYSQL* conn = handle.get();
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn, "연결 실패");
  }
  Execute(conn, "SET SESSION innodb_lock_wait_timeout=2", "락 대기 타임아웃 설정 실패");
  return handle;
}

void MariaDbClient::RunWithRetry(const std::function<void(MYSQL*)>& body) const {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      auto handle = Open();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      body(handle.get());
      return;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= config_.max_attempts) {
        throw;
      }
    }
    Backoff(attempt);
  }
}

bool MariaDbClient::InTransaction(const std::function<bool(MYSQL*)>& work) const {
  bool committed = false;
  RunWithRetry([&](MYSQL* conn) {
    committed = false;
    mysql_autocommit(conn, 0);
    bool commit = false;
    try {
      commit = work(conn);
    } catch (...) {
      mysql_rollback(conn);
      throw;
    }
    if (!commit) {
      mysql_rollback(conn);
      return;
    }
    if (mysql_commit(conn) != 0) {
      RaiseError(conn, "커밋 실패");
    }
    committed = true;
  });
  return committed;
}

void MariaDbClient::WithConnection(const std::function<void(MYSQL*)>& work) const { RunWithRetry(work); }

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_real_query(conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
    RaiseError(conn, ctx);
  }
}

std::uint64_t MariaDbClient::AffectedRows(MYSQL* conn) const {
  return static_cast<std::uint64_t>(mysql_affected_rows(conn));
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped(value.size() * 2 + 1, '\0');
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

std::string MariaDbClient::QuoteOrNull(MYSQL* conn, const std::optional<std::string>& value) const {
  if (!value) {
    return "NULL";
  }
  return "'" + Escape(conn, *value) + "'";
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  const unsigned int code = mysql_errno(conn);
  throw DbException(ctx + ": " + mysql_error(conn), code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  switch (code) {
    case kDeadlock:
    case kLockWaitTimeout:
    case CR_SERVER_LOST:
    case CR_SERVER_GONE_ERROR:
    case CR_CONN_HOST_ERROR:
    case CR_CONNECTION_ERROR:
    case CR_SERVER_LOST_EXTENDED:
      return true;
    default:
      return false;
  }
}

// 50ms부터 두 배씩 늘리고 0~25ms 지터를 더한다.
void MariaDbClient::Backoff(std::size_t attempt) const {
  thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<int> jitter(0, 25);
  const auto delay = std::chrono::milliseconds(50 * (1u << (attempt - 1)) + jitter(gen));
  std::this_thread::sleep_for(delay);
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace dispatch
