/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include "mystery/app.hpp"

int main() {
  using namespace mystery;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 값이 올바르지 않습니다: " << ex.what() << "\n";
    return 1;
  }
  if (config.store_backend != "mariadb" && config.store_backend != "memory") {
    std::cerr << "알 수 없는 STORE_BACKEND: " << config.store_backend << "\n";
    return 1;
  }
  std::cout << "저장소 " << config.store_backend << ", 스토리 경로 " << config.stories_dir << "\n";

  ServerApp app(config);
  std::signal(SIGINT, [](int) {
    std::cout << "SIGINT 수신, 종료를 준비합니다\n";
  });

  app.Run();
  return 0;
}
