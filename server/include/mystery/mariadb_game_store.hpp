/*
 * 설명: MariaDB 기반 GameStore 구현. 유일성 불변식은 DB 제약(UNIQUE/PK)으로 강제한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/mariadb_game_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "mystery/db_client.hpp"
#include "mystery/game_store.hpp"

namespace mystery {

class MariaDbGameStore : public GameStore {
 public:
  explicit MariaDbGameStore(std::shared_ptr<MariaDbClient> db_client);

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

  // 통합 테스트용. 모든 테이블을 비운다.
  void ClearAll();

 private:
  void InsertPlayerInTx(MYSQL* conn, const PlayerRecord& player);
  PlayerRecord BuildPlayer(const DbRow& row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace mystery
