/*
 * 설명: 레벨 필터가 있는 구조화 로그와 연결/메시지 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/dispatch_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace dispatch {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view name);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> principal_id;
  std::optional<std::string> connection_id;
  std::string name;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t connections_rejected{0};
  std::uint64_t messages_routed{0};
  std::uint64_t message_errors{0};
  std::uint64_t broadcasts{0};
  std::uint64_t active_groups{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void ConnectionOpened();
  void ConnectionClosed();
  void IncrementRejected();
  void IncrementRouted();
  void IncrementMessageError();
  void IncrementBroadcast();
  MetricsSnapshot Snapshot(std::uint64_t active_groups) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void Event(LogLevel level, std::string_view name, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> connections_rejected_{0};
  std::atomic<std::uint64_t> messages_routed_{0};
  std::atomic<std::uint64_t> message_errors_{0};
  std::atomic<std::uint64_t> broadcasts_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace dispatch
