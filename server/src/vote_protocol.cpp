/*
 * 설명: 투표를 기록하고 투표 사실만 세션에 알린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/vote_protocol_test.cpp
 */
#include "mystery/vote_protocol.hpp"

#include <chrono>
#include <mutex>

#include "mystery/api_response.hpp"

namespace mystery {

VoteProtocol::VoteProtocol(const StoryCatalog& catalog, std::shared_ptr<GameStore> store,
                           std::shared_ptr<SessionLocks> locks, std::shared_ptr<ConnectionRegistry> registry,
                           std::shared_ptr<Observability> observability)
    : catalog_(catalog),
      store_(std::move(store)),
      locks_(std::move(locks)),
      registry_(std::move(registry)),
      observability_(std::move(observability)) {}

bool VoteProtocol::CastVote(const std::string& game_id, const std::string& voter_id, const std::string& suspect_id,
                            OpError& error) {
  auto game = store_->FindGame(game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return false;
  }
  auto lock_ptr = locks_->For(game_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  auto voter = store_->FindPlayer(game_id, voter_id);
  if (!voter) {
    error.Set(ErrorKind::kNotFound, "player_not_found", "플레이어를 찾을 수 없습니다");
    return false;
  }
  if (suspect_id.empty() || !catalog_.FindCharacter(game->story_id, suspect_id)) {
    error.Set(ErrorKind::kNotFound, "character_not_found", "지목한 캐릭터를 찾을 수 없습니다");
    return false;
  }

  store_->UpsertVote(VoteRecord{.game_id = game_id,
                                .voter_id = voter_id,
                                .suspect_id = suspect_id,
                                .cast_at = std::chrono::system_clock::now()});
  if (observability_) {
    observability_->IncrementVoteCast();
    observability_->LogEvent(LogLevel::kInfo, "vote_cast", {{"gameId", game_id}, {"playerId", voter_id}});
  }
  registry_->Broadcast(game_id, ToWsJson(WsEnvelope{.type = "vote_cast",
                                                    .payload = {{"voter_id", voter_id}, {"voter_name", voter->name}}}));
  return true;
}

}  // namespace mystery
