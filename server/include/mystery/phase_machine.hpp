/*
 * 설명: 게임 세션의 단계와 상태를 소유하고 호스트 전용 선형 진행을 강제한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/phase_machine_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mystery/errors.hpp"
#include "mystery/game_store.hpp"
#include "mystery/phase.hpp"
#include "mystery/session_locks.hpp"
#include "mystery/story_catalog.hpp"

namespace mystery {

// 단계 기록 직후 세션 잠금을 쥔 상태에서 호출된다.
using PhaseCommitted = std::function<void(GamePhase)>;

class PhaseStateMachine {
 public:
  PhaseStateMachine(const StoryCatalog& catalog, std::shared_ptr<GameStore> store,
                    std::shared_ptr<SessionLocks> locks);

  // lobby/character_select + waiting 상태에서만 가능. 성공 시 script_reading.
  std::optional<GamePhase> Start(const std::string& game_id, const std::string& requester_id, OpError& error,
                                 const PhaseCommitted& on_commit = {});
  // 다음 단계로 한 칸 진행한다. ended에서는 game_already_ended.
  // waiting 상태에서는 character_select까지만 진행할 수 있다(game_not_started).
  std::optional<GamePhase> Advance(const std::string& game_id, const std::string& requester_id, OpError& error,
                                   const PhaseCommitted& on_commit = {});
  std::optional<GamePhase> Current(const std::string& game_id) const;

 private:
  std::optional<GameRecord> LoadForHost(const std::string& game_id, const std::string& requester_id,
                                        OpError& error);

  const StoryCatalog& catalog_;
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<SessionLocks> locks_;
};

// 단계에서 파생되는 상태: 대본 읽기 이전은 waiting, ended는 finished.
GameStatus StatusForPhase(GamePhase phase);

}  // namespace mystery
