/*
 * 설명: WebSocket 연결의 입장/가입/메시지 처리와 백프레셔 송신 큐를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/dispatch_flow_test.cpp
 */
#include "dispatch/dispatch_session.hpp"

#include <atomic>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "dispatch/api_response.hpp"

namespace dispatch {
namespace {
std::string NextConnectionId() {
  static std::atomic<std::uint64_t> counter{1};
  return "conn-" + std::to_string(counter.fetch_add(1));
}
}  // namespace

DispatchSession::DispatchSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                 ConnectionIdentity identity, std::shared_ptr<AdmissionPolicy> admission,
                                 std::shared_ptr<GroupRegistry> registry, std::shared_ptr<TripStateMachine> trips,
                                 std::shared_ptr<MessageRouter> router, std::shared_ptr<Observability> observability,
                                 std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : ws_(std::move(ws)), connection_id_(NextConnectionId()), identity_(std::move(identity)),
      admission_(std::move(admission)), registry_(std::move(registry)), trips_(std::move(trips)),
      router_(std::move(router)), observability_(std::move(observability)), membership_(registry_, connection_id_),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

DispatchSession::~DispatchSession() {
  membership_.LeaveAll();
  if (connected_) {
    observability_->ConnectionClosed();
  }
}

void DispatchSession::Run(boost::beast::http::request<boost::beast::http::string_body> req) {
  req_ = std::move(req);
  auto decision = admission_->Admit(identity_);
  if (!decision.admitted) {
    return Reject(decision);
  }
  // 101 응답 전에 가입한다. 수락 전에 도착한 프레임은 큐에서 기다린다.
  JoinInitialGroups();
  auto self = shared_from_this();
  ws_.async_accept(req_, [self](boost::beast::error_code ec) { self->OnAccept(ec); });
}

void DispatchSession::Reject(const AdmissionDecision& decision) {
  namespace http = boost::beast::http;
  observability_->IncrementRejected();
  auto fields = LogFields();
  fields["code"] = decision.code;
  fields["reason"] = identity_.anonymous_reason;
  observability_->Event(LogLevel::kInfo, "connection.rejected", fields);

  auto res = std::make_shared<http::response<http::string_body>>(http::status::forbidden, req_.version());
  res->set(http::field::server, "dispatch-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");
  res->keep_alive(false);
  res->body() = MakeErrorEnvelope(decision.code, decision.message).dump();
  res->content_length(res->body().size());
  auto self = shared_from_this();
  http::async_write(ws_.next_layer(), *res, [self, res](boost::beast::error_code ec, std::size_t) {
    self->ws_.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void DispatchSession::OnAccept(boost::beast::error_code ec) {
  if (ec) {
    closing_ = true;
    membership_.LeaveAll();
    send_queue_.clear();
    queued_bytes_ = 0;
    auto fields = LogFields();
    fields["error"] = ec.message();
    observability_->Event(LogLevel::kWarn, "connection.handshake_failed", fields);
    return;
  }
  connected_ = true;
  observability_->ConnectionOpened();
  auto fields = LogFields();
  fields["groups"] = membership_.Groups();
  observability_->Event(LogLevel::kInfo, "connection.opened", fields);
  if (closing_) {
    return CloseForBackpressure();
  }
  WriteNext();
  DoRead();
}

void DispatchSession::JoinInitialGroups() {
  if (!identity_.principal) {
    return;
  }
  auto self = shared_from_this();
  const auto& principal = *identity_.principal;
  if (principal.role == Role::kDriver) {
    membership_.Join(kDriverPoolGroup, self);
  }
  // 재접속한 참여자가 진행 중인 운행의 알림을 계속 받도록 한다.
  for (const auto& trip : trips_->OpenTripsFor(principal.id)) {
    membership_.Join(trip.id, self);
  }
}

void DispatchSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void DispatchSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed) {
    return Disconnect("closed");
  }
  if (ec) {
    return Disconnect(ec.message());
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  MessageContext ctx{shared_from_this(), identity_.principal, membership_};
  router_->Route(ctx, data);

  if (!closing_) {
    DoRead();
  } else {
    Disconnect("closing");
  }
}

void DispatchSession::Disconnect(std::string_view reason) {
  if (!connected_) {
    return;
  }
  connected_ = false;
  closing_ = true;
  membership_.LeaveAll();
  observability_->ConnectionClosed();
  auto fields = LogFields();
  fields["reason"] = reason;
  observability_->Event(LogLevel::kInfo, "connection.closed", fields);
}

void DispatchSession::Deliver(std::string frame) {
  // 다른 연결의 처리기에서 호출되므로 이 연결의 strand로 옮긴다.
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
    self->EnqueueMessage(std::move(frame));
  });
}

void DispatchSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void DispatchSession::WriteNext() {
  if (send_queue_.empty() || closing_ || !connected_ || writing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void DispatchSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void DispatchSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  auto fields = LogFields();
  fields["queuedMessages"] = send_queue_.size();
  fields["queuedBytes"] = queued_bytes_;
  observability_->Event(LogLevel::kWarn, "connection.backpressure", fields);
  // 진행 중인 쓰기의 버퍼는 완료 콜백까지 유지한다.
  if (writing_) {
    send_queue_.erase(send_queue_.begin() + 1, send_queue_.end());
    queued_bytes_ = send_queue_.front().size();
  } else {
    send_queue_.clear();
    queued_bytes_ = 0;
  }
  // 핸드셰이크 전이면 수락 직후에 닫는다.
  if (connected_) {
    CloseForBackpressure();
  }
}

void DispatchSession::CloseForBackpressure() {
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) { self->Disconnect("backpressure_exceeded"); });
}

nlohmann::json DispatchSession::LogFields() const {
  nlohmann::json fields{{"connectionId", connection_id_}};
  if (identity_.principal) {
    fields["principalId"] = identity_.principal->id;
    fields["role"] = RoleName(identity_.principal->role);
  } else {
    fields["principalId"] = nullptr;
  }
  return fields;
}

}  // namespace dispatch
