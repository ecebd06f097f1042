/*
 * 설명: 게임 단계 문자열 변환과 다음 단계 계산을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/phase_machine_test.cpp
 */
#include "mystery/phase.hpp"

#include <array>
#include <utility>

namespace mystery {
namespace {
constexpr std::array<std::pair<GamePhase, std::string_view>, 8> kPhaseNames{{
    {GamePhase::kLobby, "lobby"},
    {GamePhase::kCharacterSelect, "character_select"},
    {GamePhase::kScriptReading, "script_reading"},
    {GamePhase::kInvestigation, "investigation"},
    {GamePhase::kDiscussion, "discussion"},
    {GamePhase::kVoting, "voting"},
    {GamePhase::kReveal, "reveal"},
    {GamePhase::kEnded, "ended"},
}};

constexpr std::array<std::pair<GameStatus, std::string_view>, 3> kStatusNames{{
    {GameStatus::kWaiting, "waiting"},
    {GameStatus::kInProgress, "in_progress"},
    {GameStatus::kFinished, "finished"},
}};
}  // namespace

std::string_view ToString(GamePhase phase) { return kPhaseNames[PhaseIndex(phase)].second; }

std::string_view ToString(GameStatus status) {
  for (const auto& [value, name] : kStatusNames) {
    if (value == status) {
      return name;
    }
  }
  return "waiting";
}

std::optional<GamePhase> ParsePhase(std::string_view text) {
  for (const auto& [value, name] : kPhaseNames) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<GameStatus> ParseStatus(std::string_view text) {
  for (const auto& [value, name] : kStatusNames) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

std::size_t PhaseIndex(GamePhase phase) { return static_cast<std::size_t>(phase); }

std::optional<GamePhase> NextPhase(GamePhase phase) {
  auto index = PhaseIndex(phase);
  if (index + 1 >= kPhaseNames.size()) {
    return std::nullopt;
  }
  return kPhaseNames[index + 1].first;
}

}  // namespace mystery
