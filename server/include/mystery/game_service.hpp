/*
 * 설명: 로비 단계 연산(게임 생성, 참가, 캐릭터 목록/선택, 내 캐릭터, 게임 스냅샷)을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mystery/errors.hpp"
#include "mystery/game_store.hpp"
#include "mystery/session_locks.hpp"
#include "mystery/story_catalog.hpp"

namespace mystery {

struct CreatedGame {
  std::string game_id;
  std::string host_player_id;
};

struct CharacterView {
  std::string id;
  std::string name;
  std::string name_cn;
  std::string public_info;
  bool is_taken{false};
};

struct PlayerView {
  std::string id;
  std::string name;
  std::optional<std::string> character_id;
  std::optional<std::string> character_name;
  bool is_host{false};
  bool is_connected{false};
};

struct GameSnapshot {
  GameRecord game;
  std::string story_title;
  std::vector<PlayerView> players;
};

// 공유 코드 충돌 시 게임 생성 재시도 한도
inline constexpr std::size_t kMaxGameIdAttempts = 5;

// 8자리 공유 코드
std::string GenerateGameId();
// 128비트 난수 hex
std::string GeneratePlayerId();

class GameService {
 public:
  GameService(const StoryCatalog& catalog, std::shared_ptr<GameStore> store, std::shared_ptr<SessionLocks> locks);

  std::optional<CreatedGame> CreateGame(const std::string& story_id, const std::string& host_name, OpError& error);
  std::optional<std::string> JoinGame(const std::string& game_id, const std::string& player_name, OpError& error);
  std::optional<std::vector<CharacterView>> ListCharacters(const std::string& game_id, OpError& error);
  bool SelectCharacter(const std::string& game_id, const std::string& player_id, const std::string& character_id,
                       OpError& error);
  std::optional<CharacterRecord> MyCharacter(const std::string& game_id, const std::string& player_id,
                                             OpError& error);
  std::optional<GameSnapshot> Snapshot(const std::string& game_id, OpError& error);

 private:
  const StoryCatalog& catalog_;
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<SessionLocks> locks_;
};

}  // namespace mystery
