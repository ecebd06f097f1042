/*
 * 설명: 단일 프로세스용 인메모리 GameStore 구현. 모든 연산은 하나의 뮤텍스로 원자적이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_game_store_test.cpp
 */
#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mystery/game_store.hpp"

namespace mystery {

class MemoryGameStore : public GameStore {
 public:
  bool CreateGame(const GameRecord& game, const PlayerRecord& host) override;
  std::optional<GameRecord> FindGame(const std::string& game_id) override;
  void UpdateGameState(const std::string& game_id, GameStatus status, GamePhase phase) override;

  void InsertPlayer(const PlayerRecord& player) override;
  std::optional<PlayerRecord> FindPlayer(const std::string& game_id, const std::string& player_id) override;
  std::vector<PlayerRecord> ListPlayers(const std::string& game_id) override;
  AssignResult AssignCharacter(const std::string& game_id, const std::string& player_id,
                               const std::string& character_id) override;
  void SetConnected(const std::string& game_id, const std::string& player_id, bool connected) override;

  bool InsertFoundClue(const FoundClueRecord& record) override;
  std::vector<FoundClueRecord> ListFoundClues(const std::string& game_id) override;

  void UpsertVote(const VoteRecord& vote) override;
  std::vector<VoteRecord> ListVotes(const std::string& game_id) override;

  ChatMessageRecord AppendMessage(const ChatMessageRecord& message) override;
  std::vector<ChatMessageRecord> RecentMessages(const std::string& game_id, std::size_t limit) override;

 private:
  PlayerRecord* FindPlayerLocked(const std::string& game_id, const std::string& player_id);

  std::mutex mutex_;
  std::unordered_map<std::string, GameRecord> games_;
  std::unordered_map<std::string, std::vector<PlayerRecord>> players_;
  std::unordered_map<std::string, std::vector<FoundClueRecord>> found_clues_;
  std::unordered_map<std::string, std::map<std::string, VoteRecord>> votes_;
  std::unordered_map<std::string, std::vector<ChatMessageRecord>> messages_;
  std::int64_t next_message_id_{1};
};

}  // namespace mystery
