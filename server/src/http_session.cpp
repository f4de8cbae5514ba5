/*
 * 설명: HTTP 요청을 운영 엔드포인트와 WS 업그레이드로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/dispatch_flow_test.cpp
 */
#include "dispatch/http_session.hpp"

#include <boost/beast/version.hpp>

#include "dispatch/api_response.hpp"
#include "dispatch/dispatch_session.hpp"

namespace dispatch {
namespace {
std::string PathOf(const std::string& target) {
  auto qpos = target.find('?');
  return qpos == std::string::npos ? target : target.substr(0, qpos);
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<TrustGate> trust_gate, std::shared_ptr<AdmissionPolicy> admission,
                         std::shared_ptr<GroupRegistry> registry, std::shared_ptr<TripStateMachine> trips,
                         std::shared_ptr<MessageRouter> router, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), trust_gate_(std::move(trust_gate)),
      admission_(std::move(admission)), registry_(std::move(registry)), trips_(std::move(trips)),
      router_(std::move(router)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  namespace http = boost::beast::http;
  observability_->IncrementRequest();
  const auto path = PathOf(std::string(req_.target()));

  if (req_.method() == http::verb::get && path == "/api/health") {
    return SendJson(http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(registry_->GroupCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections",
                         {{"websocket", snapshot.websocket_active}, {"rejected", snapshot.connections_rejected}}},
                        {"messages",
                         {{"routed", snapshot.messages_routed},
                          {"errors", snapshot.message_errors},
                          {"broadcasts", snapshot.broadcasts}}},
                        {"groups", {{"active", snapshot.active_groups}}}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    auto header_it = req_.base().find("X-Ops-Token");
    std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
    if (config_.ops_token.empty() || header_token != config_.ops_token) {
      return SendJson(http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    auto snapshot = observability_->Snapshot(registry_->GroupCount());
    nlohmann::json data{{"activeWebsocket", snapshot.websocket_active},
                        {"activeGroups", snapshot.active_groups},
                        {"driverPool", registry_->MemberCount(kDriverPoolGroup)},
                        {"rejectedConnections", snapshot.connections_rejected},
                        {"messageErrorCount", snapshot.message_errors},
                        {"errorCount", snapshot.request_errors}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(data));
  }

  SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendJson(boost::beast::http::status status, const nlohmann::json& body) {
  namespace http = boost::beast::http;
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->result(status);
  res->set(http::field::server, "dispatch-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogContext{trace_id_, std::nullopt, std::nullopt, std::string(req_.target()), latency});
  boost::beast::http::async_write(stream_, *res,
                                  [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                    if (ec) {
                                      return;
                                    }
                                    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
                                  });
}

bool HttpSession::IsWebSocketPath(const std::string& path) const {
  if (path == config_.ws_path) {
    return true;
  }
  // 끝의 '/' 유무는 구분하지 않는다.
  return !config_.ws_path.empty() && config_.ws_path.back() == '/' && path + "/" == config_.ws_path;
}

void HttpSession::HandleWebSocket() {
  const auto path = PathOf(std::string(req_.target()));
  if (!IsWebSocketPath(path)) {
    observability_->IncrementRequest();
    return SendJson(boost::beast::http::status::not_found,
                    MakeErrorEnvelope("not_found", "WebSocket 경로가 아닙니다"));
  }

  // 1단계: 신원 해석. 입장 여부는 세션이 정책으로 결정한다.
  auto identity = trust_gate_->Authenticate(std::string(req_.target()));
  if (identity.Anonymous()) {
    observability_->Event(LogLevel::kDebug, "trust.anonymous",
                          {{"traceId", trace_id_}, {"reason", identity.anonymous_reason}});
  }

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "dispatch-server");
  }));
  std::make_shared<DispatchSession>(std::move(ws), std::move(identity), admission_, registry_, trips_, router_,
                                    observability_, config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run(std::move(req_));
}

}  // namespace dispatch
