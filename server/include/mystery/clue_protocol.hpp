/*
 * 설명: 장소 탐색으로 단서를 발견하고 세션당 단서별 1회 발견을 보장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/clue_protocol_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mystery/errors.hpp"
#include "mystery/game_store.hpp"
#include "mystery/observability.hpp"
#include "mystery/realtime.hpp"
#include "mystery/session_locks.hpp"
#include "mystery/story_catalog.hpp"

namespace mystery {

struct SearchRequest {
  std::string game_id;
  std::string player_id;
  std::string location_id;
  std::optional<std::string> item;
};

struct DiscoveredClue {
  std::string id;
  std::string name;
  std::string description;
  std::string location;
  std::string found_by;
  std::string finder_name;
  std::chrono::system_clock::time_point found_at;
};

class ClueProtocol {
 public:
  ClueProtocol(const StoryCatalog& catalog, std::shared_ptr<GameStore> store, std::shared_ptr<SessionLocks> locks,
               std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability);

  // 발견이 없으면 true를 반환하고 discovered는 비어 있다. 발견 시 clue_found를 브로드캐스트한다.
  bool Search(const SearchRequest& request, std::optional<DiscoveredClue>& discovered, OpError& error);
  std::optional<std::vector<DiscoveredClue>> FoundClues(const std::string& game_id, OpError& error);

 private:
  const StoryCatalog& catalog_;
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<SessionLocks> locks_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

// 대소문자를 무시한 부분 문자열 검사
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

}  // namespace mystery
