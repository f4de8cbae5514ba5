/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/dispatch_flow_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include "dispatch/app.hpp"

int main() {
  using namespace dispatch;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);

    std::signal(SIGINT, [](int) {
      std::cout << "SIGINT 수신, 종료를 준비합니다\n";
    });

    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 초기화 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
