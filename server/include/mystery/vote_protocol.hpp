/*
 * 설명: 투표를 투표자당 하나로 유지(마지막 투표 우선)하고 지목 대상은 공개하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/vote_protocol_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "mystery/errors.hpp"
#include "mystery/game_store.hpp"
#include "mystery/observability.hpp"
#include "mystery/realtime.hpp"
#include "mystery/session_locks.hpp"
#include "mystery/story_catalog.hpp"

namespace mystery {

class VoteProtocol {
 public:
  VoteProtocol(const StoryCatalog& catalog, std::shared_ptr<GameStore> store, std::shared_ptr<SessionLocks> locks,
               std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability);

  // 성공 시 vote_cast {voter_id, voter_name}만 브로드캐스트한다.
  bool CastVote(const std::string& game_id, const std::string& voter_id, const std::string& suspect_id,
                OpError& error);

 private:
  const StoryCatalog& catalog_;
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<SessionLocks> locks_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace mystery
