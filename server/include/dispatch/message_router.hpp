/*
 * 설명: 메시지 type 문자열을 처리기로 매핑하는 라우팅 테이블과 기본 처리기(echo/create/update)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_router_test.cpp, server/tests/e2e/dispatch_flow_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "dispatch/api_response.hpp"
#include "dispatch/group_registry.hpp"
#include "dispatch/observability.hpp"
#include "dispatch/principal.hpp"
#include "dispatch/trip_state_machine.hpp"

namespace dispatch {

inline constexpr const char* kEchoMessage = "echo.message";
inline constexpr const char* kCreateTrip = "create.trip";
inline constexpr const char* kUpdateTrip = "update.trip";

// 한 연결의 메시지 처리 문맥. principal이 없으면 익명 연결이다.
struct MessageContext {
  std::shared_ptr<Connection> connection;
  const std::optional<Principal>& principal;
  GroupMembership& membership;
};

using MessageHandler = std::function<void(MessageContext&, const WsMessage&)>;

class MessageRouter {
 public:
  MessageRouter(std::shared_ptr<GroupRegistry> registry, std::shared_ptr<TripStateMachine> trips,
                std::shared_ptr<Observability> observability);

  // 서버가 연결을 받기 전에만 호출한다.
  void Register(const std::string& type, MessageHandler handler);
  bool HasHandler(const std::string& type) const { return handlers_.count(type) > 0; }

  void Route(MessageContext& ctx, const std::string& raw);

  void ReplyError(MessageContext& ctx, std::string_view code, std::string_view message) const;

 private:
  void HandleEcho(MessageContext& ctx, const WsMessage& message);
  void HandleCreateTrip(MessageContext& ctx, const WsMessage& message);
  void HandleUpdateTrip(MessageContext& ctx, const WsMessage& message);
  bool RequirePrincipal(MessageContext& ctx) const;
  void Broadcast(const std::string& group, const std::string& frame);

  std::shared_ptr<GroupRegistry> registry_;
  std::shared_ptr<TripStateMachine> trips_;
  std::shared_ptr<Observability> observability_;
  std::unordered_map<std::string, MessageHandler> handlers_;
};

}  // namespace dispatch
