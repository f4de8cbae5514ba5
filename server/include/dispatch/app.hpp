/*
 * 설명: 배차 서버의 구성요소 조립과 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/dispatch_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "dispatch/config.hpp"
#include "dispatch/group_registry.hpp"
#include "dispatch/message_router.hpp"
#include "dispatch/observability.hpp"
#include "dispatch/storage.hpp"
#include "dispatch/token_service.hpp"
#include "dispatch/trip_state_machine.hpp"
#include "dispatch/trust_gate.hpp"

namespace dispatch {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  // 저장소를 외부에서 주입한다. 테스트는 인메모리 저장소를 넘긴다.
  ServerApp(const AppConfig& config, std::shared_ptr<StorageService> storage);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<StorageService> GetStorage() { return storage_; }
  std::shared_ptr<HmacTokenService> GetTokenService() { return token_service_; }
  std::shared_ptr<GroupRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<TripStateMachine> GetTripStateMachine() { return trips_; }
  std::shared_ptr<MessageRouter> GetRouter() { return router_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<StorageService> storage_;
  std::shared_ptr<HmacTokenService> token_service_;
  std::shared_ptr<TrustGate> trust_gate_;
  std::shared_ptr<AdmissionPolicy> admission_;
  std::shared_ptr<GroupRegistry> registry_;
  std::shared_ptr<TripStateMachine> trips_;
  std::shared_ptr<MessageRouter> router_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

std::shared_ptr<StorageService> MakeStorage(const AppConfig& config);

}  // namespace dispatch
