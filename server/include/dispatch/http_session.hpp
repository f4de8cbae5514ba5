/*
 * 설명: HTTP 연결을 처리하고 운영 엔드포인트(health/metrics/ops)와 신뢰 게이트를 거친 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/dispatch_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "dispatch/config.hpp"
#include "dispatch/group_registry.hpp"
#include "dispatch/message_router.hpp"
#include "dispatch/observability.hpp"
#include "dispatch/trip_state_machine.hpp"
#include "dispatch/trust_gate.hpp"

namespace dispatch {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, std::shared_ptr<TrustGate> trust_gate,
              std::shared_ptr<AdmissionPolicy> admission, std::shared_ptr<GroupRegistry> registry,
              std::shared_ptr<TripStateMachine> trips, std::shared_ptr<MessageRouter> router,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendJson(boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();
  bool IsWebSocketPath(const std::string& path) const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<TrustGate> trust_gate_;
  std::shared_ptr<AdmissionPolicy> admission_;
  std::shared_ptr<GroupRegistry> registry_;
  std::shared_ptr<TripStateMachine> trips_;
  std::shared_ptr<MessageRouter> router_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace dispatch
