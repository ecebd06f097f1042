/*
 * 설명: 게임/플레이어/단서/투표/채팅 기록을 MariaDB에 저장하고 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/sql/schema.sql
 * 테스트: server/tests/it/mariadb_game_store_it_test.cpp
 */
#include "mystery/mariadb_game_store.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mystery {
namespace {
std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::chrono::system_clock::time_point ParseTimestamp(const std::optional<std::string>& text) {
  std::tm tm{};
  std::istringstream iss(text.value_or("1970-01-01 00:00:00"));
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string Str(const std::optional<std::string>& value) { return value.value_or(""); }

bool Flag(const std::optional<std::string>& value) { return value && *value != "0"; }

std::string_view KindName(MessageKind kind) { return kind == MessageKind::kSystem ? "system" : "chat"; }

constexpr const char* kPlayerColumns =
    "SELECT id, game_id, name, character_id, is_host, is_connected, joined_at FROM players ";
}  // namespace

MariaDbGameStore::MariaDbGameStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

bool MariaDbGameStore::CreateGame(const GameRecord& game, const PlayerRecord& host) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO games(id, story_id, status, current_phase, host_id, created_at) VALUES("
        << db_client_->Quote(conn, game.id) << ", " << db_client_->Quote(conn, game.story_id) << ", '"
        << ToString(game.status) << "', '" << ToString(game.phase) << "', " << db_client_->Quote(conn, game.host_id)
        << ", '" << ToTimestamp(game.created_at) << "');";
    if (!db_client_->Execute(conn, oss.str(), "게임 생성 실패", true)) {
      return false;
    }
    InsertPlayerInTx(conn, host);
    return true;
  });
}

std::optional<GameRecord> MariaDbGameStore::FindGame(const std::string& game_id) {
  std::optional<GameRecord> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, story_id, status, current_phase, host_id, created_at FROM games WHERE id="
        << db_client_->Quote(conn, game_id) << ";";
    auto rows = db_client_->Select(conn, oss.str(), "게임 조회 실패");
    if (rows.empty()) {
      return;
    }
    const auto& row = rows.front();
    GameRecord game;
    game.id = Str(row[0]);
    game.story_id = Str(row[1]);
    game.status = ParseStatus(Str(row[2])).value_or(GameStatus::kWaiting);
    game.phase = ParsePhase(Str(row[3])).value_or(GamePhase::kLobby);
    game.host_id = Str(row[4]);
    game.created_at = ParseTimestamp(row[5]);
    result = game;
  });
  return result;
}

void MariaDbGameStore::UpdateGameState(const std::string& game_id, GameStatus status, GamePhase phase) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE games SET status='" << ToString(status) << "', current_phase='" << ToString(phase)
        << "' WHERE id=" << db_client_->Quote(conn, game_id) << ";";
    db_client_->Execute(conn, oss.str(), "게임 상태 갱신 실패");
  });
}

void MariaDbGameStore::InsertPlayer(const PlayerRecord& player) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) { InsertPlayerInTx(conn, player); });
}

void MariaDbGameStore::InsertPlayerInTx(MYSQL* conn, const PlayerRecord& player) {
  std::ostringstream oss;
  oss << "INSERT INTO players(id, game_id, name, character_id, is_host, is_connected, joined_at) VALUES("
      << db_client_->Quote(conn, player.id) << ", " << db_client_->Quote(conn, player.game_id) << ", "
      << db_client_->Quote(conn, player.name) << ", " << db_client_->QuoteOrNull(conn, player.character_id) << ", "
      << (player.is_host ? 1 : 0) << ", " << (player.is_connected ? 1 : 0) << ", '" << ToTimestamp(player.joined_at)
      << "');";
  db_client_->Execute(conn, oss.str(), "플레이어 저장 실패");
}

std::optional<PlayerRecord> MariaDbGameStore::FindPlayer(const std::string& game_id, const std::string& player_id) {
  std::optional<PlayerRecord> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << kPlayerColumns << "WHERE id=" << db_client_->Quote(conn, player_id)
        << " AND game_id=" << db_client_->Quote(conn, game_id) << ";";
    auto rows = db_client_->Select(conn, oss.str(), "플레이어 조회 실패");
    if (!rows.empty()) {
      result = BuildPlayer(rows.front());
    }
  });
  return result;
}

std::vector<PlayerRecord> MariaDbGameStore::ListPlayers(const std::string& game_id) {
  std::vector<PlayerRecord> players;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << kPlayerColumns << "WHERE game_id=" << db_client_->Quote(conn, game_id) << " ORDER BY join_seq;";
    players.clear();
    for (const auto& row : db_client_->Select(conn, oss.str(), "플레이어 목록 조회 실패")) {
      players.push_back(BuildPlayer(row));
    }
  });
  return players;
}

AssignResult MariaDbGameStore::AssignCharacter(const std::string& game_id, const std::string& player_id,
                                               const std::string& character_id) {
  AssignResult result = AssignResult::kPlayerMissing;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream select;
    select << "SELECT character_id FROM players WHERE id=" << db_client_->Quote(conn, player_id)
           << " AND game_id=" << db_client_->Quote(conn, game_id) << " FOR UPDATE;";
    auto rows = db_client_->Select(conn, select.str(), "캐릭터 할당 조회 실패");
    if (rows.empty()) {
      result = AssignResult::kPlayerMissing;
      return false;
    }
    if (rows.front()[0]) {
      result = AssignResult::kAlreadyAssigned;
      return false;
    }
    std::ostringstream update;
    update << "UPDATE players SET character_id=" << db_client_->Quote(conn, character_id)
           << " WHERE id=" << db_client_->Quote(conn, player_id) << " AND game_id=" << db_client_->Quote(conn, game_id)
           << " AND character_id IS NULL;";
    if (!db_client_->Execute(conn, update.str(), "캐릭터 할당 실패", true)) {
      result = AssignResult::kTaken;
      return false;
    }
    result = AssignResult::kAssigned;
    return true;
  });
  return result;
}

void MariaDbGameStore::SetConnected(const std::string& game_id, const std::string& player_id, bool connected) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE players SET is_connected=" << (connected ? 1 : 0) << " WHERE id=" << db_client_->Quote(conn, player_id)
        << " AND game_id=" << db_client_->Quote(conn, game_id) << ";";
    db_client_->Execute(conn, oss.str(), "접속 상태 갱신 실패");
  });
}

bool MariaDbGameStore::InsertFoundClue(const FoundClueRecord& record) {
  bool inserted = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO found_clues(game_id, clue_id, found_by, found_at) VALUES("
        << db_client_->Quote(conn, record.game_id) << ", " << db_client_->Quote(conn, record.clue_id) << ", "
        << db_client_->Quote(conn, record.found_by) << ", '" << ToTimestamp(record.found_at) << "');";
    inserted = db_client_->Execute(conn, oss.str(), "단서 발견 저장 실패", true);
  });
  return inserted;
}

std::vector<FoundClueRecord> MariaDbGameStore::ListFoundClues(const std::string& game_id) {
  std::vector<FoundClueRecord> found;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT game_id, clue_id, found_by, found_at FROM found_clues WHERE game_id="
        << db_client_->Quote(conn, game_id) << " ORDER BY id;";
    found.clear();
    for (const auto& row : db_client_->Select(conn, oss.str(), "발견 단서 조회 실패")) {
      found.push_back(FoundClueRecord{Str(row[0]), Str(row[1]), Str(row[2]), ParseTimestamp(row[3])});
    }
  });
  return found;
}

void MariaDbGameStore::UpsertVote(const VoteRecord& vote) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO votes(game_id, voter_id, suspect_id, cast_at) VALUES(" << db_client_->Quote(conn, vote.game_id)
        << ", " << db_client_->Quote(conn, vote.voter_id) << ", " << db_client_->Quote(conn, vote.suspect_id) << ", '"
        << ToTimestamp(vote.cast_at)
        << "') ON DUPLICATE KEY UPDATE suspect_id=VALUES(suspect_id), cast_at=VALUES(cast_at);";
    db_client_->Execute(conn, oss.str(), "투표 저장 실패");
  });
}

std::vector<VoteRecord> MariaDbGameStore::ListVotes(const std::string& game_id) {
  std::vector<VoteRecord> votes;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT game_id, voter_id, suspect_id, cast_at FROM votes WHERE game_id=" << db_client_->Quote(conn, game_id)
        << " ORDER BY voter_id;";
    votes.clear();
    for (const auto& row : db_client_->Select(conn, oss.str(), "투표 조회 실패")) {
      votes.push_back(VoteRecord{Str(row[0]), Str(row[1]), Str(row[2]), ParseTimestamp(row[3])});
    }
  });
  return votes;
}

ChatMessageRecord MariaDbGameStore::AppendMessage(const ChatMessageRecord& message) {
  ChatMessageRecord stored = message;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO messages(game_id, player_id, sender_name, content, message_type, created_at) VALUES("
        << db_client_->Quote(conn, message.game_id) << ", " << db_client_->QuoteOrNull(conn, message.player_id) << ", "
        << db_client_->Quote(conn, message.sender_name) << ", " << db_client_->Quote(conn, message.content) << ", '"
        << KindName(message.kind) << "', '" << ToTimestamp(message.created_at) << "');";
    db_client_->Execute(conn, oss.str(), "메시지 저장 실패");
    stored.id = static_cast<std::int64_t>(mysql_insert_id(conn));
  });
  return stored;
}

std::vector<ChatMessageRecord> MariaDbGameStore::RecentMessages(const std::string& game_id, std::size_t limit) {
  std::vector<ChatMessageRecord> messages;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, game_id, player_id, sender_name, content, message_type, created_at FROM messages WHERE game_id="
        << db_client_->Quote(conn, game_id) << " ORDER BY id DESC LIMIT " << limit << ";";
    messages.clear();
    for (const auto& row : db_client_->Select(conn, oss.str(), "메시지 조회 실패")) {
      ChatMessageRecord record;
      record.id = std::stoll(Str(row[0]));
      record.game_id = Str(row[1]);
      record.player_id = row[2];
      record.sender_name = Str(row[3]);
      record.content = Str(row[4]);
      record.kind = Str(row[5]) == "system" ? MessageKind::kSystem : MessageKind::kChat;
      record.created_at = ParseTimestamp(row[6]);
      messages.push_back(std::move(record));
    }
  });
  std::reverse(messages.begin(), messages.end());
  return messages;
}

void MariaDbGameStore::ClearAll() {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM votes;", "투표 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM messages;", "메시지 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM found_clues;", "단서 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM players;", "플레이어 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM games;", "게임 삭제 실패");
  });
}

PlayerRecord MariaDbGameStore::BuildPlayer(const DbRow& row) const {
  PlayerRecord player;
  player.id = Str(row[0]);
  player.game_id = Str(row[1]);
  player.name = Str(row[2]);
  player.character_id = row[3];
  player.is_host = Flag(row[4]);
  player.is_connected = Flag(row[5]);
  player.joined_at = ParseTimestamp(row[6]);
  return player;
}

}  // namespace mystery
