/*
 * 설명: 서버 수명주기와 리스닝 스레드, 구성요소 조립과 환경설정 로딩을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/dispatch_flow_test.cpp
 */
#include "dispatch/app.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "dispatch/db_client.hpp"
#include "dispatch/http_session.hpp"
#include "dispatch/mariadb_storage.hpp"
#include "dispatch/memory_storage.hpp"

namespace dispatch {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<TrustGate> trust_gate, std::shared_ptr<AdmissionPolicy> admission,
           std::shared_ptr<GroupRegistry> registry, std::shared_ptr<TripStateMachine> trips,
           std::shared_ptr<MessageRouter> router, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), trust_gate_(std::move(trust_gate)),
        admission_(std::move(admission)), registry_(std::move(registry)), trips_(std::move(trips)),
        router_(std::move(router)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->trust_gate_, self->admission_,
                                          self->registry_, self->trips_, self->router_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<TrustGate> trust_gate_;
  std::shared_ptr<AdmissionPolicy> admission_;
  std::shared_ptr<GroupRegistry> registry_;
  std::shared_ptr<TripStateMachine> trips_;
  std::shared_ptr<MessageRouter> router_;
  std::shared_ptr<Observability> observability_;
};

std::shared_ptr<StorageService> MakeStorage(const AppConfig& config) {
  if (config.storage_backend == "memory") {
    auto storage = std::make_shared<InMemoryStorage>();
    if (!config.principals_file.empty()) {
      storage->LoadPrincipalsFile(config.principals_file);
    }
    return storage;
  }
  if (config.storage_backend == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    return std::make_shared<MariaDbStorage>(std::make_shared<MariaDbClient>(db_config));
  }
  throw std::invalid_argument("알 수 없는 STORAGE_BACKEND: " + config.storage_backend);
}

ServerApp::ServerApp(const AppConfig& config) : ServerApp(config, MakeStorage(config)) {}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<StorageService> storage)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), storage_(std::move(storage)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  token_service_ = std::make_shared<HmacTokenService>(config.token_secret);
  if (!token_service_->HasSecret()) {
    observability_->Event(LogLevel::kWarn, "trust.no_secret", {{"detail", "TOKEN_SECRET이 비어 있어 모든 토큰이 거부됩니다"}});
  }
  trust_gate_ = std::make_shared<TrustGate>(token_service_, storage_, observability_);
  if (config.allow_anonymous) {
    admission_ = std::make_shared<AnonymousViewerPolicy>();
  } else {
    admission_ = std::make_shared<StrictAdmissionPolicy>();
  }
  registry_ = std::make_shared<InMemoryGroupRegistry>();
  TripPolicy policy{config.reject_backward_transitions, config.enforce_trip_participants};
  trips_ = std::make_shared<TripStateMachine>(storage_, observability_, policy);
  router_ = std::make_shared<MessageRouter>(registry_, trips_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, trust_gate_, admission_, registry_, trips_,
                                           router_, observability_);
    listener_->Run();
    observability_->Event(LogLevel::kInfo, "server.started",
                          {{"port", config_.port},
                           {"storage", config_.storage_backend},
                           {"wsPath", config_.ws_path},
                           {"allowAnonymous", config_.allow_anonymous}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Event(LogLevel::kError, "server.failed", {{"error", ex.what()}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_flag = [&get_env](const char* key, bool def) {
    auto value = get_env(key, def ? "true" : "false");
    return value == "1" || value == "true" || value == "yes";
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.storage_backend = get_env("STORAGE_BACKEND", "memory");
  cfg.principals_file = get_env("PRINCIPALS_FILE", "");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "dispatch_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.token_secret = get_env("TOKEN_SECRET", "");
  cfg.ws_path = get_env("WS_PATH", "/ws/trip/");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "64")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.allow_anonymous = get_flag("ALLOW_ANONYMOUS", false);
  cfg.reject_backward_transitions = get_flag("REJECT_BACKWARD_TRANSITIONS", true);
  cfg.enforce_trip_participants = get_flag("ENFORCE_TRIP_PARTICIPANTS", true);
  cfg.ops_token = get_env("OPS_TOKEN", "");
  return cfg;
}

}  // namespace dispatch
