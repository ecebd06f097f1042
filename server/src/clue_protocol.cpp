/*
 * 설명: 탐색 요청을 선언 순서의 첫 미발견 단서로 해석하고 발견 이벤트를 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/clue_protocol_test.cpp
 */
#include "mystery/clue_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_map>

#include "mystery/api_response.hpp"

namespace mystery {

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
  return it != haystack.end();
}

ClueProtocol::ClueProtocol(const StoryCatalog& catalog, std::shared_ptr<GameStore> store,
                           std::shared_ptr<SessionLocks> locks, std::shared_ptr<ConnectionRegistry> registry,
                           std::shared_ptr<Observability> observability)
    : catalog_(catalog),
      store_(std::move(store)),
      locks_(std::move(locks)),
      registry_(std::move(registry)),
      observability_(std::move(observability)) {}

bool ClueProtocol::Search(const SearchRequest& request, std::optional<DiscoveredClue>& discovered, OpError& error) {
  discovered.reset();
  // 없는 게임으로 잠금 슬롯을 만들지 않는다.
  auto game = store_->FindGame(request.game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return false;
  }
  auto lock_ptr = locks_->For(request.game_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  auto player = store_->FindPlayer(request.game_id, request.player_id);
  if (!player) {
    error.Set(ErrorKind::kNotFound, "player_not_found", "플레이어를 찾을 수 없습니다");
    return false;
  }

  for (const ClueRecord* clue : catalog_.CluesAt(game->story_id, request.location_id)) {
    if (request.item && !ContainsIgnoreCase(clue->discovery_hint, *request.item)) {
      continue;
    }
    const auto now = std::chrono::system_clock::now();
    FoundClueRecord record{
        .game_id = request.game_id, .clue_id = clue->id, .found_by = request.player_id, .found_at = now};
    if (!store_->InsertFoundClue(record)) {
      continue;
    }
    discovered = DiscoveredClue{.id = clue->id,
                                .name = clue->name,
                                .description = clue->description,
                                .location = clue->location,
                                .found_by = request.player_id,
                                .finder_name = player->name,
                                .found_at = now};
    break;
  }
  if (!discovered) {
    return true;
  }

  if (observability_) {
    observability_->IncrementClueFound();
    observability_->LogEvent(LogLevel::kInfo, "clue_found",
                             {{"gameId", request.game_id}, {"playerId", request.player_id}, {"clueId", discovered->id}});
  }
  registry_->Broadcast(request.game_id,
                       ToWsJson(WsEnvelope{.type = "clue_found",
                                           .payload = {{"finder_id", request.player_id},
                                                       {"finder_name", player->name},
                                                       {"clue",
                                                        {{"id", discovered->id},
                                                         {"name", discovered->name},
                                                         {"description", discovered->description}}}}}));
  return true;
}

std::optional<std::vector<DiscoveredClue>> ClueProtocol::FoundClues(const std::string& game_id, OpError& error) {
  auto game = store_->FindGame(game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  std::unordered_map<std::string, std::string> names;
  for (const auto& player : store_->ListPlayers(game_id)) {
    names[player.id] = player.name;
  }

  std::vector<DiscoveredClue> clues;
  for (const auto& record : store_->ListFoundClues(game_id)) {
    const ClueRecord* clue = catalog_.FindClue(game->story_id, record.clue_id);
    if (!clue) {
      continue;
    }
    auto name_it = names.find(record.found_by);
    clues.push_back(DiscoveredClue{.id = clue->id,
                                   .name = clue->name,
                                   .description = clue->description,
                                   .location = clue->location,
                                   .found_by = record.found_by,
                                   .finder_name = name_it != names.end() ? name_it->second : std::string{},
                                   .found_at = record.found_at});
  }
  return clues;
}

}  // namespace mystery
