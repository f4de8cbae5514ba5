/*
 * 설명: 서버 환경설정과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/dispatch_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace dispatch {

struct AppConfig {
  unsigned short port{8080};
  std::string storage_backend{"memory"};
  std::string principals_file;
  std::string db_host{"mariadb"};
  unsigned short db_port{3306};
  std::string db_user{"app"};
  std::string db_password{"app_pass"};
  std::string db_name{"dispatch_db"};
  std::string log_level{"info"};
  std::string token_secret;
  std::string ws_path{"/ws/trip/"};
  std::size_t ws_queue_limit_messages{64};
  std::size_t ws_queue_limit_bytes{1048576};
  bool allow_anonymous{false};
  bool reject_backward_transitions{true};
  bool enforce_trip_participants{true};
  std::string ops_token;
};

AppConfig LoadConfigFromEnv();

}  // namespace dispatch
