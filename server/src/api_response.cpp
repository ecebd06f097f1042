/*
 * 설명: JSON 응답 엔벨로프를 생성하고 실시간 메시지를 직렬화/검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "mystery/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mystery {

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["type"] = env.type;
  j["payload"] = env.payload.is_null() ? nlohmann::json::object() : env.payload;
  return j;
}

WsEnvelope ParseWsEnvelope(const nlohmann::json& message) {
  if (!message.is_object()) {
    throw std::invalid_argument("메시지는 객체여야 합니다");
  }
  auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    throw std::invalid_argument("type 필드가 필요합니다");
  }
  WsEnvelope env{.type = type_it->get<std::string>(), .payload = nlohmann::json::object()};
  auto payload_it = message.find("payload");
  if (payload_it != message.end() && !payload_it->is_null()) {
    if (!payload_it->is_object()) {
      throw std::invalid_argument("payload는 객체여야 합니다");
    }
    env.payload = *payload_it;
  }
  return env;
}

}  // namespace mystery
