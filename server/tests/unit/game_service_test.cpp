#include <gtest/gtest.h>

#include "unit/test_support.hpp"

using mystery::ErrorKind;
using mystery::GamePhase;
using mystery::GameStatus;
using mystery::OpError;

namespace {

// 앞선 몇 번의 생성 요청을 id 충돌처럼 거절한다.
class CollidingStore : public mystery::MemoryGameStore {
 public:
  explicit CollidingStore(int rejections) : rejections_(rejections) {}

  bool CreateGame(const mystery::GameRecord& game, const mystery::PlayerRecord& host) override {
    attempted_ids.push_back(game.id);
    if (rejections_ > 0) {
      --rejections_;
      return false;
    }
    return mystery::MemoryGameStore::CreateGame(game, host);
  }

  std::vector<std::string> attempted_ids;

 private:
  int rejections_;
};

}  // namespace

TEST(GameServiceTest, IdsHaveExpectedShape) {
  auto game_id = mystery::GenerateGameId();
  auto player_id = mystery::GeneratePlayerId();
  EXPECT_EQ(game_id.size(), 8u);
  EXPECT_EQ(player_id.size(), 32u);
  EXPECT_EQ(game_id.find_first_not_of("0123456789abcdef"), std::string::npos);
  EXPECT_NE(mystery::GeneratePlayerId(), player_id);
}

TEST(GameServiceTest, CreateGameRegistersDisconnectedHost) {
  testing_support::Harness h;
  OpError error;
  auto created = h.games->CreateGame(testing_support::kStoryId, "alice", error);
  ASSERT_TRUE(created.has_value());

  auto game = h.store->FindGame(created->game_id);
  ASSERT_TRUE(game.has_value());
  EXPECT_EQ(game->phase, GamePhase::kLobby);
  EXPECT_EQ(game->status, GameStatus::kWaiting);
  EXPECT_EQ(game->host_id, created->host_player_id);

  auto host = h.store->FindPlayer(created->game_id, created->host_player_id);
  ASSERT_TRUE(host.has_value());
  EXPECT_TRUE(host->is_host);
  EXPECT_FALSE(host->is_connected);
  EXPECT_FALSE(host->character_id.has_value());
}

TEST(GameServiceTest, CreateGameRejectsUnknownStoryAndEmptyName) {
  testing_support::Harness h;
  OpError error;
  EXPECT_FALSE(h.games->CreateGame("no_such_story", "alice", error).has_value());
  EXPECT_EQ(error.code, "story_not_found");
  EXPECT_EQ(error.kind, ErrorKind::kNotFound);

  OpError empty_name;
  EXPECT_FALSE(h.games->CreateGame(testing_support::kStoryId, "", empty_name).has_value());
  EXPECT_EQ(empty_name.kind, ErrorKind::kBadRequest);
}

TEST(GameServiceTest, FullLifecycleReachesEnded) {
  testing_support::Harness h;
  std::string game_id;
  auto players = h.SeedGame(4, game_id);

  OpError error;
  auto started = h.phases->Start(game_id, players[0], error);
  ASSERT_TRUE(started.has_value()) << error.code;
  EXPECT_EQ(*started, GamePhase::kScriptReading);
  EXPECT_EQ(h.store->FindGame(game_id)->status, GameStatus::kInProgress);

  const GamePhase expected[] = {GamePhase::kInvestigation, GamePhase::kDiscussion, GamePhase::kVoting,
                                GamePhase::kReveal};
  for (auto phase : expected) {
    auto next = h.phases->Advance(game_id, players[0], error);
    ASSERT_TRUE(next.has_value()) << error.code;
    EXPECT_EQ(*next, phase);
    EXPECT_EQ(h.store->FindGame(game_id)->status, GameStatus::kInProgress);
  }

  auto ended = h.phases->Advance(game_id, players[0], error);
  ASSERT_TRUE(ended.has_value());
  EXPECT_EQ(*ended, GamePhase::kEnded);
  EXPECT_EQ(h.store->FindGame(game_id)->status, GameStatus::kFinished);

  OpError after_end;
  EXPECT_FALSE(h.phases->Advance(game_id, players[0], after_end).has_value());
  EXPECT_EQ(after_end.code, "game_already_ended");
  EXPECT_EQ(after_end.kind, ErrorKind::kConflict);
}

TEST(GameServiceTest, JoinRejectsFullGame) {
  testing_support::Harness h;
  std::string game_id;
  h.SeedGame(5, game_id);

  OpError error;
  EXPECT_FALSE(h.games->JoinGame(game_id, "late", error).has_value());
  EXPECT_EQ(error.code, "game_full");
  EXPECT_EQ(h.store->ListPlayers(game_id).size(), 5u);
}

TEST(GameServiceTest, JoinRejectsStartedGame) {
  testing_support::Harness h;
  std::string game_id;
  auto players = h.SeedGame(4, game_id);
  OpError error;
  ASSERT_TRUE(h.phases->Start(game_id, players[0], error).has_value());

  OpError join_error;
  EXPECT_FALSE(h.games->JoinGame(game_id, "late", join_error).has_value());
  EXPECT_EQ(join_error.code, "game_not_waiting");
  EXPECT_EQ(join_error.kind, ErrorKind::kConflict);
}

TEST(GameServiceTest, JoinUnknownGame) {
  testing_support::Harness h;
  OpError error;
  EXPECT_FALSE(h.games->JoinGame("ffffffff", "bob", error).has_value());
  EXPECT_EQ(error.code, "game_not_found");
}

TEST(GameServiceTest, CharacterSelectionIsExclusive) {
  testing_support::Harness h;
  OpError error;
  auto created = h.games->CreateGame(testing_support::kStoryId, "alice", error);
  auto bob = h.games->JoinGame(created->game_id, "bob", error);
  ASSERT_TRUE(bob.has_value());

  ASSERT_TRUE(h.games->SelectCharacter(created->game_id, created->host_player_id, "butler", error));

  OpError taken;
  EXPECT_FALSE(h.games->SelectCharacter(created->game_id, *bob, "butler", taken));
  EXPECT_EQ(taken.code, "character_taken");

  OpError again;
  EXPECT_FALSE(h.games->SelectCharacter(created->game_id, created->host_player_id, "maid", again));
  EXPECT_EQ(again.code, "character_already_selected");

  OpError unknown;
  EXPECT_FALSE(h.games->SelectCharacter(created->game_id, *bob, "gardener", unknown));
  EXPECT_EQ(unknown.code, "character_not_found");

  auto characters = h.games->ListCharacters(created->game_id, error);
  ASSERT_TRUE(characters.has_value());
  ASSERT_EQ(characters->size(), 5u);
  EXPECT_TRUE((*characters)[0].is_taken);
  EXPECT_FALSE((*characters)[1].is_taken);
}

TEST(GameServiceTest, MyCharacterRequiresSelection) {
  testing_support::Harness h;
  OpError error;
  auto created = h.games->CreateGame(testing_support::kStoryId, "alice", error);

  OpError none;
  EXPECT_FALSE(h.games->MyCharacter(created->game_id, created->host_player_id, none).has_value());
  EXPECT_EQ(none.code, "no_character");
  EXPECT_EQ(none.kind, ErrorKind::kPreconditionFailed);

  ASSERT_TRUE(h.games->SelectCharacter(created->game_id, created->host_player_id, "cook", error));
  auto mine = h.games->MyCharacter(created->game_id, created->host_player_id, error);
  ASSERT_TRUE(mine.has_value());
  EXPECT_EQ(mine->id, "cook");
  EXPECT_EQ(mine->private_background, "Private background of cook");
}

TEST(GameServiceTest, SnapshotResolvesCharacterNames) {
  testing_support::Harness h;
  std::string game_id;
  h.SeedGame(4, game_id);

  OpError error;
  auto snapshot = h.games->Snapshot(game_id, error);
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->story_title, "Test Manor");
  ASSERT_EQ(snapshot->players.size(), 4u);
  EXPECT_TRUE(snapshot->players[0].is_host);
  EXPECT_EQ(snapshot->players[0].name, "host");
  ASSERT_TRUE(snapshot->players[1].character_name.has_value());
  EXPECT_EQ(*snapshot->players[1].character_name, "The maid");
}

TEST(GameServiceTest, StartChecksPreconditions) {
  testing_support::Harness h;
  OpError error;
  auto created = h.games->CreateGame(testing_support::kStoryId, "alice", error);
  std::vector<std::string> others;
  for (int i = 0; i < 3; ++i) {
    others.push_back(*h.games->JoinGame(created->game_id, "p" + std::to_string(i), error));
  }

  OpError not_host;
  EXPECT_FALSE(h.phases->Start(created->game_id, others[0], not_host).has_value());
  EXPECT_EQ(not_host.code, "unauthorized");

  OpError incomplete;
  EXPECT_FALSE(h.phases->Start(created->game_id, created->host_player_id, incomplete).has_value());
  EXPECT_EQ(incomplete.code, "characters_incomplete");
  EXPECT_EQ(h.store->FindGame(created->game_id)->phase, GamePhase::kLobby);
}

TEST(GameServiceTest, CreateGameRegeneratesCollidingId) {
  testing_support::Harness h;
  auto store = std::make_shared<CollidingStore>(2);
  mystery::GameService games(h.catalog, store, h.locks);

  OpError error;
  auto created = games.CreateGame(testing_support::kStoryId, "alice", error);
  ASSERT_TRUE(created.has_value()) << error.code;
  ASSERT_EQ(store->attempted_ids.size(), 3u);
  EXPECT_EQ(store->attempted_ids.back(), created->game_id);
  EXPECT_TRUE(store->FindGame(created->game_id).has_value());
  EXPECT_EQ(store->ListPlayers(created->game_id).size(), 1u);
}

TEST(GameServiceTest, CreateGameGivesUpAfterRepeatedCollisions) {
  testing_support::Harness h;
  auto store = std::make_shared<CollidingStore>(1000);
  mystery::GameService games(h.catalog, store, h.locks);

  OpError error;
  EXPECT_FALSE(games.CreateGame(testing_support::kStoryId, "alice", error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::kInternal);
  EXPECT_EQ(error.code, "internal_error");
  EXPECT_EQ(mystery::HttpStatusFor(error.kind), 500u);
  EXPECT_EQ(store->attempted_ids.size(), mystery::kMaxGameIdAttempts);
}

TEST(GameServiceTest, UnknownGameIdsDoNotAllocateSessionLocks) {
  testing_support::Harness h;
  for (int i = 0; i < 1000; ++i) {
    const std::string missing = "missing" + std::to_string(i);
    OpError error;
    EXPECT_FALSE(h.games->JoinGame(missing, "bob", error).has_value());
    EXPECT_EQ(error.code, "game_not_found");
    h.phases->Start(missing, "host", error);
    h.phases->Advance(missing, "host", error);
    std::optional<mystery::DiscoveredClue> discovered;
    h.clues->Search({.game_id = missing, .player_id = "p", .location_id = "study", .item = std::nullopt},
                    discovered, error);
    h.votes->CastVote(missing, "p", "butler", error);
    h.coordinator->HandleMessage(missing, "host", R"({"type":"phase_change","payload":{"phase":"lobby"}})");
  }
  EXPECT_EQ(h.locks->Size(), 0u);

  std::string game_id;
  h.SeedGame(2, game_id);
  EXPECT_EQ(h.locks->Size(), 1u);
}
