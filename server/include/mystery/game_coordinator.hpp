/*
 * 설명: 실시간 채널의 수신 메시지를 각 프로토콜로 분배하고 단계 알림/내레이션을 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_coordinator_test.cpp, server/tests/unit/game_service_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>

#include "mystery/chat_service.hpp"
#include "mystery/clue_protocol.hpp"
#include "mystery/errors.hpp"
#include "mystery/game_store.hpp"
#include "mystery/narrative.hpp"
#include "mystery/observability.hpp"
#include "mystery/phase_machine.hpp"
#include "mystery/realtime.hpp"
#include "mystery/session_locks.hpp"
#include "mystery/vote_protocol.hpp"

namespace mystery {

// 최근 채팅 조회 범위. 토론 입력은 이 중 마지막 다섯 개만 쓴다.
inline constexpr std::size_t kNarrationHistoryLimit = 20;

struct CoordinatorDeps {
  std::shared_ptr<GameStore> store;
  std::shared_ptr<SessionLocks> locks;
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<PhaseStateMachine> phases;
  std::shared_ptr<ClueProtocol> clues;
  std::shared_ptr<VoteProtocol> votes;
  std::shared_ptr<ChatService> chat;
  std::shared_ptr<NarrativeOrchestrator> narrator;
  std::shared_ptr<Observability> observability;
};

// 내레이션 완료 통지. 내레이션 실행기 스레드에서 호출된다.
using NarrationDone = std::function<void(bool ok, std::optional<std::string> content, OpError error)>;

class GameCoordinator : public std::enable_shared_from_this<GameCoordinator> {
 public:
  // narration_executor는 외부 모델 호출을 수행한다. I/O 스레드와 분리된 풀을 넘긴다.
  GameCoordinator(boost::asio::any_io_executor narration_executor, CoordinatorDeps deps,
                  bool narrate_on_phase_change);

  // 성공 시 다른 참가자에게 player_joined를 알린다.
  bool OnConnect(const std::string& game_id, const std::string& player_id,
                 const std::shared_ptr<ConnectionHandle>& handle, OpError& error);
  // 교체된(오래된) 핸들이면 아무 일도 하지 않는다.
  void OnDisconnect(const std::string& game_id, const std::string& player_id, const ConnectionHandle* handle);
  // 실패는 보낸 플레이어에게만 error 이벤트로 돌려준다.
  void HandleMessage(const std::string& game_id, const std::string& player_id, const std::string& raw);

  // 단계 변경을 브로드캐스트하고 설정에 따라 내레이션을 예약한다.
  // PhaseStateMachine의 커밋 콜백으로 세션 잠금 아래에서 불린다. 블로킹 호출을 넣지 않는다.
  void AnnouncePhase(const std::string& game_id, GamePhase phase);
  void ScheduleNarration(const std::string& game_id, const std::string& action);
  // Narrate를 내레이션 실행기에서 수행하고 결과를 done으로 넘긴다.
  void NarrateAsync(const std::string& game_id, const std::string& action, NarrationDone done);
  // 현재 단계의 내레이션을 생성해 기록/브로드캐스트한다. 내레이션이 없는 단계면 content는 비어 있다.
  bool Narrate(const std::string& game_id, const std::string& action, std::optional<std::string>& content,
               OpError& error);

 private:
  void Dispatch(const std::string& game_id, const std::string& player_id, const std::string& type,
                const nlohmann::json& payload);
  void HandlePhaseChange(const std::string& game_id, const std::string& player_id, const nlohmann::json& payload);
  void SendError(const std::string& game_id, const std::string& player_id, const std::string& code,
                 const std::string& message);

  boost::asio::any_io_executor narration_executor_;
  CoordinatorDeps deps_;
  bool narrate_on_phase_change_;
};

}  // namespace mystery
