/*
 * 설명: 구조화 로그 출력과 메트릭 카운터를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "dispatch/observability.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>

namespace dispatch {
namespace {
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}

void WriteLine(const nlohmann::json& line) {
  auto text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << text << std::endl;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view name) {
  if (name == "debug") {
    return LogLevel::kDebug;
  }
  if (name == "warn" || name == "warning") {
    return LogLevel::kWarn;
  }
  if (name == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
    case LogLevel::kInfo:
      break;
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::ConnectionOpened() { websocket_active_.fetch_add(1); }

void Observability::ConnectionClosed() { websocket_active_.fetch_sub(1); }

void Observability::IncrementRejected() { connections_rejected_.fetch_add(1); }

void Observability::IncrementRouted() { messages_routed_.fetch_add(1); }

void Observability::IncrementMessageError() { message_errors_.fetch_add(1); }

void Observability::IncrementBroadcast() { broadcasts_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_groups) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.connections_rejected = connections_rejected_.load();
  snapshot.messages_routed = messages_routed_.load();
  snapshot.message_errors = message_errors_.load();
  snapshot.broadcasts = broadcasts_.load();
  snapshot.active_groups = active_groups;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(LogLevel::kInfo)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(LogLevel::kInfo);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.principal_id) {
    log_json["principalId"] = *ctx.principal_id;
  }
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  WriteLine(log_json);
}

void Observability::Event(LogLevel level, std::string_view name, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json{{"detail", fields}};
  log_json["level"] = LogLevelName(level);
  log_json["eventName"] = name;
  WriteLine(log_json);
}

}  // namespace dispatch
