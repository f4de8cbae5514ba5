/*
 * 설명: 수신 메시지를 파싱해 처리기로 보내고, 운행 레코드를 그룹에 팬아웃한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_router_test.cpp
 */
#include "dispatch/message_router.hpp"

namespace dispatch {
namespace {
// 주체 참조는 문자열 또는 정수 식별자를 받는다.
bool ReadId(const nlohmann::json& value, std::optional<std::string>& out) {
  if (value.is_null()) {
    out.reset();
    return true;
  }
  if (value.is_string() && !value.get<std::string>().empty()) {
    out = value.get<std::string>();
    return true;
  }
  if (value.is_number_integer()) {
    out = std::to_string(value.get<long long>());
    return true;
  }
  return false;
}

bool ReadText(const nlohmann::json& data, const char* key, std::optional<std::string>& out) {
  auto it = data.find(key);
  if (it == data.end()) {
    return true;
  }
  if (!it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

std::string TripFrame(const char* type, const TripRecord& record) {
  return ToWsJson(WsMessage{type, TripToJson(record), std::nullopt}).dump();
}
}  // namespace

MessageRouter::MessageRouter(std::shared_ptr<GroupRegistry> registry, std::shared_ptr<TripStateMachine> trips,
                             std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), trips_(std::move(trips)), observability_(std::move(observability)) {
  Register(kEchoMessage, [this](MessageContext& ctx, const WsMessage& message) { HandleEcho(ctx, message); });
  Register(kCreateTrip, [this](MessageContext& ctx, const WsMessage& message) { HandleCreateTrip(ctx, message); });
  Register(kUpdateTrip, [this](MessageContext& ctx, const WsMessage& message) { HandleUpdateTrip(ctx, message); });
}

void MessageRouter::Register(const std::string& type, MessageHandler handler) {
  handlers_[type] = std::move(handler);
}

void MessageRouter::Route(MessageContext& ctx, const std::string& raw) {
  std::string error_code;
  std::string error_message;
  auto message = ParseWsMessage(raw, error_code, error_message);
  if (!message) {
    ReplyError(ctx, error_code, error_message);
    return;
  }
  auto it = handlers_.find(message->type);
  if (it == handlers_.end()) {
    observability_->Event(LogLevel::kWarn, "message.unknown_type",
                          {{"type", message->type}, {"connectionId", ctx.connection->ConnectionId()}});
    ReplyError(ctx, "unknown_type", "알 수 없는 메시지 유형: " + message->type);
    return;
  }
  observability_->IncrementRouted();
  try {
    it->second(ctx, *message);
  } catch (const nlohmann::json::exception& ex) {
    ReplyError(ctx, "bad_request", ex.what());
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kError, "message.handler_failed",
                          {{"type", message->type}, {"connectionId", ctx.connection->ConnectionId()},
                           {"error", ex.what()}});
    ReplyError(ctx, "internal_error", "메시지 처리 중 오류가 발생했습니다");
  }
}

void MessageRouter::ReplyError(MessageContext& ctx, std::string_view code, std::string_view message) const {
  observability_->IncrementMessageError();
  registry_->SendToConnection(*ctx.connection, MakeWsError(code, message, code == "storage_unavailable").dump());
}

bool MessageRouter::RequirePrincipal(MessageContext& ctx) const {
  if (ctx.principal) {
    return true;
  }
  ReplyError(ctx, "unauthorized", "인증된 연결만 운행 기능을 사용할 수 있습니다");
  return false;
}

void MessageRouter::Broadcast(const std::string& group, const std::string& frame) {
  auto delivered = registry_->Send(group, frame);
  observability_->IncrementBroadcast();
  if (observability_->Enabled(LogLevel::kDebug)) {
    observability_->Event(LogLevel::kDebug, "group.broadcast", {{"group", group}, {"delivered", delivered}});
  }
}

void MessageRouter::HandleEcho(MessageContext& ctx, const WsMessage& message) {
  auto frame = ToWsJson(WsMessage{message.type, message.data, std::nullopt}).dump();
  if (!message.group) {
    registry_->SendToConnection(*ctx.connection, frame);
    return;
  }
  if (!ctx.principal || ctx.principal->role != Role::kOwner) {
    ReplyError(ctx, "forbidden", "그룹 echo는 OWNER만 사용할 수 있습니다");
    return;
  }
  Broadcast(*message.group, frame);
}

void MessageRouter::HandleCreateTrip(MessageContext& ctx, const WsMessage& message) {
  if (!RequirePrincipal(ctx)) {
    return;
  }
  const auto& data = message.data;
  if (!data.is_object()) {
    ReplyError(ctx, "bad_request", "data는 객체여야 합니다");
    return;
  }
  std::optional<std::string> pickup;
  std::optional<std::string> dropoff;
  if (!ReadText(data, "pickup", pickup) || !ReadText(data, "dropoff", dropoff) || !pickup || !dropoff) {
    ReplyError(ctx, "bad_request", "pickup과 dropoff 문자열이 필요합니다");
    return;
  }
  std::optional<std::string> rider_id;
  auto rider_it = data.find("rider");
  if (rider_it != data.end() && !ReadId(*rider_it, rider_id)) {
    ReplyError(ctx, "bad_request", "rider 식별자 형식이 올바르지 않습니다");
    return;
  }

  std::string error_code;
  std::string error_message;
  auto record = trips_->Create(*ctx.principal, *pickup, *dropoff, rider_id, error_code, error_message);
  if (!record) {
    ReplyError(ctx, error_code, error_message);
    return;
  }
  auto frame = TripFrame(kCreateTrip, *record);
  registry_->SendToConnection(*ctx.connection, frame);
  ctx.membership.Join(record->trip.id, ctx.connection);
  Broadcast(kDriverPoolGroup, frame);
}

void MessageRouter::HandleUpdateTrip(MessageContext& ctx, const WsMessage& message) {
  if (!RequirePrincipal(ctx)) {
    return;
  }
  const auto& data = message.data;
  if (!data.is_object()) {
    ReplyError(ctx, "bad_request", "data는 객체여야 합니다");
    return;
  }
  auto id_it = data.find("id");
  if (id_it == data.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
    ReplyError(ctx, "bad_request", "운행 id가 필요합니다");
    return;
  }
  const auto trip_id = id_it->get<std::string>();

  TripUpdate update;
  if (!ReadText(data, "pickup", update.pickup) || !ReadText(data, "dropoff", update.dropoff)) {
    ReplyError(ctx, "bad_request", "pickup/dropoff는 문자열이어야 합니다");
    return;
  }
  auto status_it = data.find("status");
  if (status_it != data.end()) {
    std::optional<TripStatus> status;
    if (status_it->is_string()) {
      status = ParseTripStatus(status_it->get<std::string>());
    }
    if (!status) {
      ReplyError(ctx, "invalid_status", "status는 REQUESTED, STARTED, IN_PROGRESS, COMPLETED 중 하나여야 합니다");
      return;
    }
    update.status = status;
  }
  auto driver_it = data.find("driver");
  if (driver_it != data.end()) {
    update.assign_driver = true;
    if (!ReadId(*driver_it, update.driver_id)) {
      ReplyError(ctx, "bad_request", "driver 식별자 형식이 올바르지 않습니다");
      return;
    }
  }

  std::string error_code;
  std::string error_message;
  auto record = trips_->Update(*ctx.principal, trip_id, update, error_code, error_message);
  if (!record) {
    ReplyError(ctx, error_code, error_message);
    return;
  }
  if (!ctx.membership.Contains(record->trip.id)) {
    ctx.membership.Join(record->trip.id, ctx.connection);
  }
  Broadcast(record->trip.id, TripFrame(kUpdateTrip, *record));
}

}  // namespace dispatch
