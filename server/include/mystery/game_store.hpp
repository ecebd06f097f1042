/*
 * 설명: 게임/플레이어/발견 단서/채팅/투표의 영속 기록 인터페이스를 정의한다.
 *       쓰기는 같은 프로세스의 다음 읽기에서 즉시 보여야 하며 연산 단위 원자성만 요구한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_game_store_test.cpp, server/tests/it/mariadb_game_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mystery/phase.hpp"

namespace mystery {

struct GameRecord {
  std::string id;
  std::string story_id;
  GameStatus status{GameStatus::kWaiting};
  GamePhase phase{GamePhase::kLobby};
  std::string host_id;
  std::chrono::system_clock::time_point created_at;
};

struct PlayerRecord {
  std::string id;
  std::string game_id;
  std::string name;
  std::optional<std::string> character_id;
  bool is_host{false};
  bool is_connected{false};
  std::chrono::system_clock::time_point joined_at;
};

struct FoundClueRecord {
  std::string game_id;
  std::string clue_id;
  std::string found_by;
  std::chrono::system_clock::time_point found_at;
};

struct VoteRecord {
  std::string game_id;
  std::string voter_id;
  std::string suspect_id;
  std::chrono::system_clock::time_point cast_at;
};

enum class MessageKind { kChat, kSystem };

struct ChatMessageRecord {
  std::int64_t id{0};
  std::string game_id;
  std::optional<std::string> player_id;
  std::string sender_name;
  std::string content;
  MessageKind kind{MessageKind::kChat};
  std::chrono::system_clock::time_point created_at;
};

enum class AssignResult { kAssigned, kTaken, kAlreadyAssigned, kPlayerMissing };

class GameStore {
 public:
  virtual ~GameStore() = default;

  // 게임과 호스트 플레이어를 함께 기록한다. 같은 id의 게임이 이미 있으면 아무것도 쓰지 않고 false.
  virtual bool CreateGame(const GameRecord& game, const PlayerRecord& host) = 0;
  virtual std::optional<GameRecord> FindGame(const std::string& game_id) = 0;
  virtual void UpdateGameState(const std::string& game_id, GameStatus status, GamePhase phase) = 0;

  virtual void InsertPlayer(const PlayerRecord& player) = 0;
  virtual std::optional<PlayerRecord> FindPlayer(const std::string& game_id, const std::string& player_id) = 0;
  // 참가 순서대로 반환한다.
  virtual std::vector<PlayerRecord> ListPlayers(const std::string& game_id) = 0;
  // (game, character) 유일성과 플레이어당 1회 할당을 저장소 수준에서 보장한다.
  virtual AssignResult AssignCharacter(const std::string& game_id, const std::string& player_id,
                                       const std::string& character_id) = 0;
  virtual void SetConnected(const std::string& game_id, const std::string& player_id, bool connected) = 0;

  // (game, clue)가 이미 있으면 false를 반환하고 아무것도 바꾸지 않는다.
  virtual bool InsertFoundClue(const FoundClueRecord& record) = 0;
  virtual std::vector<FoundClueRecord> ListFoundClues(const std::string& game_id) = 0;

  // (game, voter) 기준으로 덮어쓴다.
  virtual void UpsertVote(const VoteRecord& vote) = 0;
  virtual std::vector<VoteRecord> ListVotes(const std::string& game_id) = 0;

  // id를 부여한 기록을 반환한다.
  virtual ChatMessageRecord AppendMessage(const ChatMessageRecord& message) = 0;
  // 최근 limit개를 오래된 순으로 반환한다.
  virtual std::vector<ChatMessageRecord> RecentMessages(const std::string& game_id, std::size_t limit) = 0;
};

}  // namespace mystery
