#include <gtest/gtest.h>

#include "mystery/memory_game_store.hpp"

using namespace mystery;

namespace {
void SeedGame(MemoryGameStore& store) {
  const auto now = std::chrono::system_clock::now();
  store.CreateGame(GameRecord{.id = "g1", .story_id = "s", .status = GameStatus::kWaiting, .phase = GamePhase::kLobby,
                              .host_id = "p1", .created_at = now},
                   PlayerRecord{.id = "p1", .game_id = "g1", .name = "alice", .character_id = std::nullopt,
                                .is_host = true, .is_connected = false, .joined_at = now});
  store.InsertPlayer(PlayerRecord{.id = "p2", .game_id = "g1", .name = "bob", .character_id = std::nullopt,
                                  .is_host = false, .is_connected = false, .joined_at = now});
}
}  // namespace

TEST(MemoryGameStoreTest, AssignCharacterEnforcesUniqueness) {
  MemoryGameStore store;
  SeedGame(store);
  EXPECT_EQ(store.AssignCharacter("g1", "p1", "butler"), AssignResult::kAssigned);
  EXPECT_EQ(store.AssignCharacter("g1", "p2", "butler"), AssignResult::kTaken);
  EXPECT_EQ(store.AssignCharacter("g1", "p1", "maid"), AssignResult::kAlreadyAssigned);
  EXPECT_EQ(store.AssignCharacter("g1", "p9", "maid"), AssignResult::kPlayerMissing);
  EXPECT_EQ(*store.FindPlayer("g1", "p1")->character_id, "butler");
}

TEST(MemoryGameStoreTest, PlayersListedInJoinOrder) {
  MemoryGameStore store;
  SeedGame(store);
  auto players = store.ListPlayers("g1");
  ASSERT_EQ(players.size(), 2u);
  EXPECT_EQ(players[0].id, "p1");
  EXPECT_EQ(players[1].id, "p2");
  EXPECT_TRUE(store.ListPlayers("g2").empty());
}

TEST(MemoryGameStoreTest, FoundClueIsInsertedOnce) {
  MemoryGameStore store;
  SeedGame(store);
  const auto now = std::chrono::system_clock::now();
  EXPECT_TRUE(store.InsertFoundClue({.game_id = "g1", .clue_id = "c1", .found_by = "p1", .found_at = now}));
  EXPECT_FALSE(store.InsertFoundClue({.game_id = "g1", .clue_id = "c1", .found_by = "p2", .found_at = now}));
  auto found = store.ListFoundClues("g1");
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].found_by, "p1");
}

TEST(MemoryGameStoreTest, VoteUpsertKeepsLatestChoice) {
  MemoryGameStore store;
  SeedGame(store);
  const auto now = std::chrono::system_clock::now();
  store.UpsertVote({.game_id = "g1", .voter_id = "p1", .suspect_id = "butler", .cast_at = now});
  store.UpsertVote({.game_id = "g1", .voter_id = "p1", .suspect_id = "maid", .cast_at = now});
  store.UpsertVote({.game_id = "g1", .voter_id = "p2", .suspect_id = "butler", .cast_at = now});
  auto votes = store.ListVotes("g1");
  ASSERT_EQ(votes.size(), 2u);
  for (const auto& vote : votes) {
    if (vote.voter_id == "p1") {
      EXPECT_EQ(vote.suspect_id, "maid");
    }
  }
}

TEST(MemoryGameStoreTest, RecentMessagesReturnsNewestWindowOldestFirst) {
  MemoryGameStore store;
  SeedGame(store);
  for (int i = 0; i < 6; ++i) {
    ChatMessageRecord message;
    message.game_id = "g1";
    message.player_id = "p1";
    message.sender_name = "alice";
    message.content = "m" + std::to_string(i);
    auto stored = store.AppendMessage(message);
    EXPECT_GT(stored.id, 0);
  }
  auto recent = store.RecentMessages("g1", 3);
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent[0].content, "m3");
  EXPECT_EQ(recent[2].content, "m5");
  EXPECT_LT(recent[0].id, recent[2].id);
  EXPECT_EQ(store.RecentMessages("g1", 50).size(), 6u);
  EXPECT_TRUE(store.RecentMessages("g2", 5).empty());
}

TEST(MemoryGameStoreTest, UpdateGameStateAndConnectedFlag) {
  MemoryGameStore store;
  SeedGame(store);
  store.UpdateGameState("g1", GameStatus::kInProgress, GamePhase::kInvestigation);
  auto game = store.FindGame("g1");
  EXPECT_EQ(game->status, GameStatus::kInProgress);
  EXPECT_EQ(game->phase, GamePhase::kInvestigation);

  store.SetConnected("g1", "p2", true);
  EXPECT_TRUE(store.FindPlayer("g1", "p2")->is_connected);
  EXPECT_FALSE(store.FindGame("missing").has_value());
}

TEST(MemoryGameStoreTest, DuplicateGameIdIsRejected) {
  MemoryGameStore store;
  SeedGame(store);
  const auto now = std::chrono::system_clock::now();
  EXPECT_FALSE(store.CreateGame(GameRecord{.id = "g1", .story_id = "other", .status = GameStatus::kWaiting,
                                           .phase = GamePhase::kLobby, .host_id = "p9", .created_at = now},
                                PlayerRecord{.id = "p9", .game_id = "g1", .name = "mallory",
                                             .character_id = std::nullopt, .is_host = true, .is_connected = false,
                                             .joined_at = now}));
  auto game = store.FindGame("g1");
  EXPECT_EQ(game->story_id, "s");
  EXPECT_EQ(game->host_id, "p1");
  EXPECT_EQ(store.ListPlayers("g1").size(), 2u);
  EXPECT_FALSE(store.FindPlayer("g1", "p9").has_value());
}
