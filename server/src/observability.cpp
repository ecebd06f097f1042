/*
 * 설명: 구조화 로그와 메트릭 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "mystery/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mystery {
namespace {
std::string_view LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.clues_found = clues_found_.load();
  snapshot.votes_cast = votes_cast_.load();
  snapshot.narrations = narrations_.load();
  snapshot.narration_failures = narration_failures_.load();
  snapshot.transport_failures = transport_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["level"] = ctx.status >= 500 ? "error" : "info";
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  log_json["status"] = ctx.status;
  if (ctx.game_id) {
    log_json["gameId"] = *ctx.game_id;
  }
  if (ctx.player_id) {
    log_json["playerId"] = *ctx.player_id;
  }
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << log_json.dump() << std::endl;
}

void Observability::LogEvent(LogLevel level, std::string_view name, const nlohmann::json& fields) const {
  if (level < level_) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["level"] = LevelName(level);
  log_json["eventName"] = name;
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << log_json.dump() << std::endl;
}

}  // namespace mystery
