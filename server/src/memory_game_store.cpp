/*
 * 설명: 인메모리 GameStore 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_game_store_test.cpp
 */
#include "mystery/memory_game_store.hpp"

#include <algorithm>

namespace mystery {

bool MemoryGameStore::CreateGame(const GameRecord& game, const PlayerRecord& host) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!games_.emplace(game.id, game).second) {
    return false;
  }
  players_[game.id].push_back(host);
  return true;
}

std::optional<GameRecord> MemoryGameStore::FindGame(const std::string& game_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = games_.find(game_id);
  if (it == games_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryGameStore::UpdateGameState(const std::string& game_id, GameStatus status, GamePhase phase) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = games_.find(game_id);
  if (it == games_.end()) {
    return;
  }
  it->second.status = status;
  it->second.phase = phase;
}

void MemoryGameStore::InsertPlayer(const PlayerRecord& player) {
  std::lock_guard<std::mutex> lock(mutex_);
  players_[player.game_id].push_back(player);
}

std::optional<PlayerRecord> MemoryGameStore::FindPlayer(const std::string& game_id, const std::string& player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* player = FindPlayerLocked(game_id, player_id);
  if (!player) {
    return std::nullopt;
  }
  return *player;
}

std::vector<PlayerRecord> MemoryGameStore::ListPlayers(const std::string& game_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = players_.find(game_id);
  if (it == players_.end()) {
    return {};
  }
  return it->second;
}

AssignResult MemoryGameStore::AssignCharacter(const std::string& game_id, const std::string& player_id,
                                              const std::string& character_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* player = FindPlayerLocked(game_id, player_id);
  if (!player) {
    return AssignResult::kPlayerMissing;
  }
  if (player->character_id) {
    return AssignResult::kAlreadyAssigned;
  }
  const auto& roster = players_[game_id];
  bool taken = std::any_of(roster.begin(), roster.end(), [&](const PlayerRecord& p) {
    return p.character_id && *p.character_id == character_id;
  });
  if (taken) {
    return AssignResult::kTaken;
  }
  player->character_id = character_id;
  return AssignResult::kAssigned;
}

void MemoryGameStore::SetConnected(const std::string& game_id, const std::string& player_id, bool connected) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* player = FindPlayerLocked(game_id, player_id);
  if (player) {
    player->is_connected = connected;
  }
}

bool MemoryGameStore::InsertFoundClue(const FoundClueRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& found = found_clues_[record.game_id];
  bool exists = std::any_of(found.begin(), found.end(),
                            [&](const FoundClueRecord& r) { return r.clue_id == record.clue_id; });
  if (exists) {
    return false;
  }
  found.push_back(record);
  return true;
}

std::vector<FoundClueRecord> MemoryGameStore::ListFoundClues(const std::string& game_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = found_clues_.find(game_id);
  if (it == found_clues_.end()) {
    return {};
  }
  return it->second;
}

void MemoryGameStore::UpsertVote(const VoteRecord& vote) {
  std::lock_guard<std::mutex> lock(mutex_);
  votes_[vote.game_id][vote.voter_id] = vote;
}

std::vector<VoteRecord> MemoryGameStore::ListVotes(const std::string& game_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<VoteRecord> out;
  auto it = votes_.find(game_id);
  if (it == votes_.end()) {
    return out;
  }
  for (const auto& [voter, vote] : it->second) {
    out.push_back(vote);
  }
  return out;
}

ChatMessageRecord MemoryGameStore::AppendMessage(const ChatMessageRecord& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  ChatMessageRecord stored = message;
  stored.id = next_message_id_++;
  messages_[message.game_id].push_back(stored);
  return stored;
}

std::vector<ChatMessageRecord> MemoryGameStore::RecentMessages(const std::string& game_id, std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = messages_.find(game_id);
  if (it == messages_.end()) {
    return {};
  }
  const auto& all = it->second;
  auto start = all.size() > limit ? all.size() - limit : 0;
  return std::vector<ChatMessageRecord>(all.begin() + static_cast<std::ptrdiff_t>(start), all.end());
}

PlayerRecord* MemoryGameStore::FindPlayerLocked(const std::string& game_id, const std::string& player_id) {
  auto it = players_.find(game_id);
  if (it == players_.end()) {
    return nullptr;
  }
  for (auto& player : it->second) {
    if (player.id == player_id) {
      return &player;
    }
  }
  return nullptr;
}

}  // namespace mystery
