/*
 * 설명: 연결 하나의 입장 결정, 그룹 가입, 메시지 라우팅, 백프레셔가 있는 송신 큐를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/dispatch_flow_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "dispatch/group_registry.hpp"
#include "dispatch/message_router.hpp"
#include "dispatch/observability.hpp"
#include "dispatch/trip_state_machine.hpp"
#include "dispatch/trust_gate.hpp"

namespace dispatch {

class DispatchSession : public Connection, public std::enable_shared_from_this<DispatchSession> {
 public:
  DispatchSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, ConnectionIdentity identity,
                  std::shared_ptr<AdmissionPolicy> admission, std::shared_ptr<GroupRegistry> registry,
                  std::shared_ptr<TripStateMachine> trips, std::shared_ptr<MessageRouter> router,
                  std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                  std::size_t max_queue_bytes);
  ~DispatchSession() override;

  // 입장 정책을 적용한 뒤 업그레이드를 수락하거나 403으로 거절한다.
  void Run(boost::beast::http::request<boost::beast::http::string_body> req);

  const std::string& ConnectionId() const override { return connection_id_; }
  void Deliver(std::string frame) override;

 private:
  void Reject(const AdmissionDecision& decision);
  void OnAccept(boost::beast::error_code ec);
  void JoinInitialGroups();
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void Disconnect(std::string_view reason);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void CloseForBackpressure();
  nlohmann::json LogFields() const;

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::string connection_id_;
  ConnectionIdentity identity_;
  std::shared_ptr<AdmissionPolicy> admission_;
  std::shared_ptr<GroupRegistry> registry_;
  std::shared_ptr<TripStateMachine> trips_;
  std::shared_ptr<MessageRouter> router_;
  std::shared_ptr<Observability> observability_;
  GroupMembership membership_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool connected_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace dispatch
