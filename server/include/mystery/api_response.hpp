/*
 * 설명: REST 응답 엔벨로프와 실시간 채널 메시지 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mystery {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// 실시간 채널 메시지: { "type": ..., "payload": {...} }
struct WsEnvelope {
  std::string type;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);
// 형식이 올바르지 않으면 std::invalid_argument를 던진다. payload가 없으면 빈 객체로 채운다.
WsEnvelope ParseWsEnvelope(const nlohmann::json& message);

std::string ToIsoString(std::chrono::system_clock::time_point tp);

}  // namespace mystery
