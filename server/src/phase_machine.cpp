/*
 * 설명: 단계 진행 규칙을 저장소 위에서 세션 단위 직렬화로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/phase_machine_test.cpp, server/tests/unit/game_service_test.cpp
 */
#include "mystery/phase_machine.hpp"

#include <algorithm>
#include <mutex>

namespace mystery {

GameStatus StatusForPhase(GamePhase phase) {
  if (phase == GamePhase::kEnded) {
    return GameStatus::kFinished;
  }
  if (PhaseIndex(phase) >= PhaseIndex(GamePhase::kScriptReading)) {
    return GameStatus::kInProgress;
  }
  return GameStatus::kWaiting;
}

PhaseStateMachine::PhaseStateMachine(const StoryCatalog& catalog, std::shared_ptr<GameStore> store,
                                     std::shared_ptr<SessionLocks> locks)
    : catalog_(catalog), store_(std::move(store)), locks_(std::move(locks)) {}

std::optional<GameRecord> PhaseStateMachine::LoadForHost(const std::string& game_id,
                                                         const std::string& requester_id, OpError& error) {
  auto game = store_->FindGame(game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  if (game->host_id != requester_id) {
    error.Set(ErrorKind::kUnauthorized, "unauthorized", "호스트만 단계를 진행할 수 있습니다");
    return std::nullopt;
  }
  return game;
}

std::optional<GamePhase> PhaseStateMachine::Start(const std::string& game_id, const std::string& requester_id,
                                                  OpError& error, const PhaseCommitted& on_commit) {
  if (!store_->FindGame(game_id)) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  auto lock_ptr = locks_->For(game_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  auto game = LoadForHost(game_id, requester_id, error);
  if (!game) {
    return std::nullopt;
  }
  const bool startable = game->status == GameStatus::kWaiting &&
                         (game->phase == GamePhase::kLobby || game->phase == GamePhase::kCharacterSelect);
  if (!startable) {
    error.Set(ErrorKind::kConflict, "game_already_started", "이미 시작된 게임입니다");
    return std::nullopt;
  }
  const Story* story = catalog_.Find(game->story_id);
  if (!story) {
    error.Set(ErrorKind::kNotFound, "story_not_found", "스토리를 찾을 수 없습니다");
    return std::nullopt;
  }

  auto players = store_->ListPlayers(game_id);
  if (static_cast<int>(players.size()) < story->player_count.min) {
    error.Set(ErrorKind::kConflict, "insufficient_players",
              "최소 " + std::to_string(story->player_count.min) + "명의 플레이어가 필요합니다");
    return std::nullopt;
  }
  const bool all_ready = std::all_of(players.begin(), players.end(),
                                     [](const PlayerRecord& p) { return p.character_id.has_value(); });
  if (!all_ready) {
    error.Set(ErrorKind::kPreconditionFailed, "characters_incomplete", "모든 플레이어가 캐릭터를 선택해야 합니다");
    return std::nullopt;
  }

  store_->UpdateGameState(game_id, GameStatus::kInProgress, GamePhase::kScriptReading);
  if (on_commit) {
    on_commit(GamePhase::kScriptReading);
  }
  return GamePhase::kScriptReading;
}

std::optional<GamePhase> PhaseStateMachine::Advance(const std::string& game_id, const std::string& requester_id,
                                                    OpError& error, const PhaseCommitted& on_commit) {
  if (!store_->FindGame(game_id)) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  auto lock_ptr = locks_->For(game_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  auto game = LoadForHost(game_id, requester_id, error);
  if (!game) {
    return std::nullopt;
  }
  auto next = NextPhase(game->phase);
  if (!next) {
    error.Set(ErrorKind::kConflict, "game_already_ended", "이미 종료된 게임입니다");
    return std::nullopt;
  }
  // script_reading 진입은 Start의 인원/캐릭터 검사를 거쳐야 한다.
  if (game->status == GameStatus::kWaiting && PhaseIndex(*next) >= PhaseIndex(GamePhase::kScriptReading)) {
    error.Set(ErrorKind::kConflict, "game_not_started", "게임을 먼저 시작해야 합니다");
    return std::nullopt;
  }
  // 진행 중인 게임은 waiting으로 되돌리지 않는다.
  GameStatus status = StatusForPhase(*next);
  if (status == GameStatus::kWaiting && game->status != GameStatus::kWaiting) {
    status = game->status;
  }
  store_->UpdateGameState(game_id, status, *next);
  if (on_commit) {
    on_commit(*next);
  }
  return next;
}

std::optional<GamePhase> PhaseStateMachine::Current(const std::string& game_id) const {
  auto game = store_->FindGame(game_id);
  if (!game) {
    return std::nullopt;
  }
  return game->phase;
}

}  // namespace mystery
