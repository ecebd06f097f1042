/*
 * 설명: 로비 연산을 저장소와 스토리 카탈로그 위에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_service_test.cpp
 */
#include "mystery/game_service.hpp"

#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include <openssl/rand.h>

namespace mystery {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}
}  // namespace

std::string GenerateGameId() { return RandomHex(4); }

std::string GeneratePlayerId() { return RandomHex(16); }

GameService::GameService(const StoryCatalog& catalog, std::shared_ptr<GameStore> store,
                         std::shared_ptr<SessionLocks> locks)
    : catalog_(catalog), store_(std::move(store)), locks_(std::move(locks)) {}

std::optional<CreatedGame> GameService::CreateGame(const std::string& story_id, const std::string& host_name,
                                                   OpError& error) {
  if (host_name.empty()) {
    error.Set(ErrorKind::kBadRequest, "bad_request", "호스트 이름이 필요합니다");
    return std::nullopt;
  }
  if (!catalog_.Find(story_id)) {
    error.Set(ErrorKind::kNotFound, "story_not_found", "스토리를 찾을 수 없습니다");
    return std::nullopt;
  }

  // 게임 id는 짧은 공유 코드라 충돌하면 새로 뽑는다.
  for (std::size_t attempt = 0; attempt < kMaxGameIdAttempts; ++attempt) {
    const auto now = std::chrono::system_clock::now();
    GameRecord game{.id = GenerateGameId(),
                    .story_id = story_id,
                    .status = GameStatus::kWaiting,
                    .phase = GamePhase::kLobby,
                    .host_id = GeneratePlayerId(),
                    .created_at = now};
    PlayerRecord host{.id = game.host_id,
                      .game_id = game.id,
                      .name = host_name,
                      .character_id = std::nullopt,
                      .is_host = true,
                      .is_connected = false,
                      .joined_at = now};
    if (store_->CreateGame(game, host)) {
      return CreatedGame{.game_id = game.id, .host_player_id = host.id};
    }
  }
  error.Set(ErrorKind::kInternal, "internal_error", "게임 id를 할당하지 못했습니다");
  return std::nullopt;
}

std::optional<std::string> GameService::JoinGame(const std::string& game_id, const std::string& player_name,
                                                 OpError& error) {
  if (player_name.empty()) {
    error.Set(ErrorKind::kBadRequest, "bad_request", "플레이어 이름이 필요합니다");
    return std::nullopt;
  }
  if (!store_->FindGame(game_id)) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  auto lock_ptr = locks_->For(game_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);

  // 상태와 인원은 잠금 안에서 다시 읽는다.
  auto game = store_->FindGame(game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  if (game->status != GameStatus::kWaiting) {
    error.Set(ErrorKind::kConflict, "game_not_waiting", "이미 진행 중인 게임입니다");
    return std::nullopt;
  }
  const Story* story = catalog_.Find(game->story_id);
  if (!story) {
    error.Set(ErrorKind::kNotFound, "story_not_found", "스토리를 찾을 수 없습니다");
    return std::nullopt;
  }
  if (static_cast<int>(store_->ListPlayers(game_id).size()) >= story->player_count.max) {
    error.Set(ErrorKind::kConflict, "game_full", "정원이 가득 찼습니다");
    return std::nullopt;
  }

  PlayerRecord player{.id = GeneratePlayerId(),
                      .game_id = game_id,
                      .name = player_name,
                      .character_id = std::nullopt,
                      .is_host = false,
                      .is_connected = false,
                      .joined_at = std::chrono::system_clock::now()};
  store_->InsertPlayer(player);
  return player.id;
}

std::optional<std::vector<CharacterView>> GameService::ListCharacters(const std::string& game_id, OpError& error) {
  auto game = store_->FindGame(game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  const Story* story = catalog_.Find(game->story_id);
  if (!story) {
    error.Set(ErrorKind::kNotFound, "story_not_found", "스토리를 찾을 수 없습니다");
    return std::nullopt;
  }

  std::unordered_set<std::string> taken;
  for (const auto& player : store_->ListPlayers(game_id)) {
    if (player.character_id) {
      taken.insert(*player.character_id);
    }
  }
  std::vector<CharacterView> views;
  views.reserve(story->characters.size());
  for (const auto& character : story->characters) {
    views.push_back(CharacterView{.id = character.id,
                                  .name = character.name,
                                  .name_cn = character.name_cn,
                                  .public_info = character.public_info,
                                  .is_taken = taken.count(character.id) > 0});
  }
  return views;
}

bool GameService::SelectCharacter(const std::string& game_id, const std::string& player_id,
                                  const std::string& character_id, OpError& error) {
  auto game = store_->FindGame(game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return false;
  }
  if (!catalog_.FindCharacter(game->story_id, character_id)) {
    error.Set(ErrorKind::kNotFound, "character_not_found", "캐릭터를 찾을 수 없습니다");
    return false;
  }

  switch (store_->AssignCharacter(game_id, player_id, character_id)) {
    case AssignResult::kAssigned:
      return true;
    case AssignResult::kTaken:
      error.Set(ErrorKind::kConflict, "character_taken", "이미 선택된 캐릭터입니다");
      return false;
    case AssignResult::kAlreadyAssigned:
      error.Set(ErrorKind::kConflict, "character_already_selected", "이미 캐릭터를 선택했습니다");
      return false;
    case AssignResult::kPlayerMissing:
      error.Set(ErrorKind::kNotFound, "player_not_found", "플레이어를 찾을 수 없습니다");
      return false;
  }
  return false;
}

std::optional<CharacterRecord> GameService::MyCharacter(const std::string& game_id, const std::string& player_id,
                                                        OpError& error) {
  auto game = store_->FindGame(game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  auto player = store_->FindPlayer(game_id, player_id);
  if (!player) {
    error.Set(ErrorKind::kNotFound, "player_not_found", "플레이어를 찾을 수 없습니다");
    return std::nullopt;
  }
  if (!player->character_id) {
    error.Set(ErrorKind::kPreconditionFailed, "no_character", "선택한 캐릭터가 없습니다");
    return std::nullopt;
  }
  const CharacterRecord* character = catalog_.FindCharacter(game->story_id, *player->character_id);
  if (!character) {
    error.Set(ErrorKind::kNotFound, "character_not_found", "캐릭터를 찾을 수 없습니다");
    return std::nullopt;
  }
  return *character;
}

std::optional<GameSnapshot> GameService::Snapshot(const std::string& game_id, OpError& error) {
  auto game = store_->FindGame(game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  const Story* story = catalog_.Find(game->story_id);

  GameSnapshot snapshot{.game = *game, .story_title = story ? story->title : "Unknown", .players = {}};
  for (const auto& player : store_->ListPlayers(game_id)) {
    PlayerView view{.id = player.id,
                    .name = player.name,
                    .character_id = player.character_id,
                    .character_name = std::nullopt,
                    .is_host = player.is_host,
                    .is_connected = player.is_connected};
    if (player.character_id) {
      if (const auto* character = catalog_.FindCharacter(game->story_id, *player.character_id)) {
        view.character_name = character->name;
      }
    }
    snapshot.players.push_back(std::move(view));
  }
  return snapshot;
}

}  // namespace mystery
