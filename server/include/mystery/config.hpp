/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace mystery {

struct AppConfig {
  unsigned short port;
  // "mariadb" 또는 "memory"
  std::string store_backend;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string stories_dir;
  std::string log_level;
  std::string llm_host;
  std::string llm_port;
  std::string llm_model;
  std::string llm_api_key;
  double llm_temperature;
  std::size_t llm_timeout_seconds;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  bool narrate_on_phase_change;
};

AppConfig LoadConfigFromEnv();

}  // namespace mystery
