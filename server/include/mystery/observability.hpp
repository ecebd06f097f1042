/*
 * 설명: 구조화 로그(JSON 라인)와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mystery {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

LogLevel ParseLogLevel(std::string_view text);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> game_id;
  std::optional<std::string> player_id;
  std::string name;
  long latency_ms{0};
  unsigned int status{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t clues_found{0};
  std::uint64_t votes_cast{0};
  std::uint64_t narrations{0};
  std::uint64_t narration_failures{0};
  std::uint64_t transport_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo) : level_(level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementClueFound() { clues_found_.fetch_add(1); }
  void IncrementVoteCast() { votes_cast_.fetch_add(1); }
  void IncrementNarration() { narrations_.fetch_add(1); }
  void IncrementNarrationFailure() { narration_failures_.fetch_add(1); }
  void IncrementTransportFailure() { transport_failures_.fetch_add(1); }
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot() const;

  // HTTP 요청 단위 로그.
  void Log(const LogContext& ctx) const;
  // 도메인 이벤트 로그. fields는 객체여야 한다.
  void LogEvent(LogLevel level, std::string_view name, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  LogLevel level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> clues_found_{0};
  std::atomic<std::uint64_t> votes_cast_{0};
  std::atomic<std::uint64_t> narrations_{0};
  std::atomic<std::uint64_t> narration_failures_{0};
  std::atomic<std::uint64_t> transport_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace mystery
