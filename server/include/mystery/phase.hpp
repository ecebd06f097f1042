/*
 * 설명: 게임 단계(phase)와 상태(status) 열거형 및 선형 진행 규칙을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/phase_machine_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace mystery {

enum class GamePhase {
  kLobby,
  kCharacterSelect,
  kScriptReading,
  kInvestigation,
  kDiscussion,
  kVoting,
  kReveal,
  kEnded,
};

enum class GameStatus {
  kWaiting,
  kInProgress,
  kFinished,
};

std::string_view ToString(GamePhase phase);
std::string_view ToString(GameStatus status);
std::optional<GamePhase> ParsePhase(std::string_view text);
std::optional<GameStatus> ParseStatus(std::string_view text);

// lobby=0 ... ended=7
std::size_t PhaseIndex(GamePhase phase);

// ended 이후에는 다음 단계가 없다.
std::optional<GamePhase> NextPhase(GamePhase phase);

}  // namespace mystery
