#include <chrono>
#include <mutex>
#include <thread>

#include <gtest/gtest.h>

#include "unit/test_support.hpp"

using mystery::GamePhase;
using mystery::OpError;

namespace {

struct CoordinatorFixture : public ::testing::Test {
  void SetUp() override {
    players = h.SeedGame(4, game_id);
    for (const auto& player : players) {
      connections.push_back(h.Connect(game_id, player));
    }
  }

  void StartGame() {
    OpError error;
    ASSERT_TRUE(h.phases->Start(game_id, players[0], error).has_value()) << error.code;
  }

  testing_support::Harness h;
  std::string game_id;
  std::vector<std::string> players;
  std::vector<std::shared_ptr<testing_support::FakeConnection>> connections;
};

}  // namespace

TEST_F(CoordinatorFixture, JoinNoticeGoesToOthersOnly) {
  // 마지막으로 접속한 플레이어는 자기 접속 알림을 받지 않는다.
  EXPECT_TRUE(connections[3]->FramesOfType("player_joined").empty());
  auto notices = connections[0]->FramesOfType("player_joined");
  ASSERT_EQ(notices.size(), 3u);
  EXPECT_EQ(notices.back()["payload"]["player_id"], players[3]);
  EXPECT_EQ(notices.back()["payload"]["player_name"], "player3");
}

TEST_F(CoordinatorFixture, ConnectUnknownPlayerFails) {
  OpError error;
  auto connection = std::make_shared<testing_support::FakeConnection>();
  EXPECT_FALSE(h.coordinator->OnConnect(game_id, "nobody", connection, error));
  EXPECT_EQ(error.code, "player_not_found");
}

TEST_F(CoordinatorFixture, DisconnectNotifiesOthersAndClearsFlag) {
  h.coordinator->OnDisconnect(game_id, players[1], connections[1].get());

  EXPECT_FALSE(h.store->FindPlayer(game_id, players[1])->is_connected);
  EXPECT_TRUE(connections[1]->FramesOfType("player_left").empty());
  auto notices = connections[2]->FramesOfType("player_left");
  ASSERT_EQ(notices.size(), 1u);
  EXPECT_EQ(notices[0]["payload"]["player_id"], players[1]);
}

TEST_F(CoordinatorFixture, StaleDisconnectIsIgnored) {
  auto replacement = h.Connect(game_id, players[1]);
  h.coordinator->OnDisconnect(game_id, players[1], connections[1].get());

  EXPECT_TRUE(h.store->FindPlayer(game_id, players[1])->is_connected);
  EXPECT_TRUE(connections[2]->FramesOfType("player_left").empty());
}

TEST_F(CoordinatorFixture, ChatIsBroadcastToEveryone) {
  h.coordinator->HandleMessage(game_id, players[1], R"({"type":"chat","payload":{"content":"I saw the butler"}})");

  for (const auto& connection : connections) {
    auto chats = connection->FramesOfType("chat");
    ASSERT_EQ(chats.size(), 1u);
    EXPECT_EQ(chats[0]["payload"]["sender_name"], "player1");
    EXPECT_EQ(chats[0]["payload"]["content"], "I saw the butler");
  }
}

TEST_F(CoordinatorFixture, EmptyChatIsRejectedToSenderOnly) {
  h.coordinator->HandleMessage(game_id, players[1], R"({"type":"chat","payload":{"content":""}})");

  auto errors = connections[1]->FramesOfType("error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["payload"]["code"], "bad_request");
  EXPECT_TRUE(connections[0]->FramesOfType("error").empty());
  EXPECT_TRUE(connections[0]->FramesOfType("chat").empty());
}

TEST_F(CoordinatorFixture, SearchBroadcastsDiscovery) {
  StartGame();
  h.coordinator->HandleMessage(game_id, players[2], R"({"type":"search","payload":{"location_id":"study"}})");

  auto found = connections[0]->FramesOfType("clue_found");
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0]["payload"]["clue"]["id"], "letter");
  EXPECT_EQ(found[0]["payload"]["finder_name"], "player2");
}

TEST_F(CoordinatorFixture, SearchWithoutLocationIsBadRequest) {
  h.coordinator->HandleMessage(game_id, players[2], R"({"type":"search","payload":{}})");
  auto errors = connections[2]->FramesOfType("error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["payload"]["code"], "bad_request");
}

TEST_F(CoordinatorFixture, VoteIsAnnouncedWithoutSuspect) {
  h.coordinator->HandleMessage(game_id, players[1], R"({"type":"vote","payload":{"suspect_id":"butler"}})");

  auto casts = connections[3]->FramesOfType("vote_cast");
  ASSERT_EQ(casts.size(), 1u);
  EXPECT_EQ(casts[0]["payload"]["voter_id"], players[1]);
  EXPECT_FALSE(casts[0]["payload"].contains("suspect_id"));
  ASSERT_EQ(h.store->ListVotes(game_id).size(), 1u);
}

TEST_F(CoordinatorFixture, PhaseChangeRequiresHost) {
  h.coordinator->HandleMessage(game_id, players[1], R"({"type":"phase_change","payload":{"phase":"lobby"}})");
  auto errors = connections[1]->FramesOfType("error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["payload"]["code"], "unauthorized");
  EXPECT_TRUE(connections[0]->FramesOfType("phase_change").empty());
}

TEST_F(CoordinatorFixture, PhaseChangeMustMatchDurablePhase) {
  StartGame();
  h.coordinator->HandleMessage(game_id, players[0], R"({"type":"phase_change","payload":{"phase":"reveal"}})");
  auto errors = connections[0]->FramesOfType("error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["payload"]["code"], "phase_mismatch");
  EXPECT_EQ(h.store->FindGame(game_id)->phase, GamePhase::kScriptReading);

  h.coordinator->HandleMessage(game_id, players[0],
                               R"({"type":"phase_change","payload":{"phase":"script_reading"}})");
  auto changes = connections[2]->FramesOfType("phase_change");
  ASSERT_EQ(changes.size(), 1u);
  EXPECT_EQ(changes[0]["payload"]["phase"], "script_reading");
}

TEST_F(CoordinatorFixture, UnknownTypeAndBadJsonAreBadRequests) {
  h.coordinator->HandleMessage(game_id, players[1], R"({"type":"dance","payload":{}})");
  h.coordinator->HandleMessage(game_id, players[1], "{not json");

  auto errors = connections[1]->FramesOfType("error");
  ASSERT_EQ(errors.size(), 2u);
  EXPECT_EQ(errors[0]["payload"]["code"], "bad_request");
  EXPECT_EQ(errors[1]["payload"]["code"], "bad_request");
  EXPECT_TRUE(connections[0]->Frames().size() == connections[0]->FramesOfType("player_joined").size());
}

TEST_F(CoordinatorFixture, GmRequestProducesNarrationAfterQueueRuns) {
  StartGame();
  h.coordinator->HandleMessage(game_id, players[1], R"({"type":"gm_request","payload":{"action":"Look around"}})");
  EXPECT_TRUE(connections[0]->FramesOfType("narration").empty());

  h.ioc.run();

  auto narrations = connections[0]->FramesOfType("narration");
  ASSERT_EQ(narrations.size(), 1u);
  EXPECT_EQ(narrations[0]["payload"]["phase"], "script_reading");
  EXPECT_EQ(narrations[0]["payload"]["content"], "The fog thickens.");

  auto history = h.store->RecentMessages(game_id, 10);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].kind, mystery::MessageKind::kSystem);
  EXPECT_EQ(history[0].sender_name, mystery::kGameMasterName);
}

TEST_F(CoordinatorFixture, NarrateAsyncRunsOnNarrationExecutor) {
  StartGame();
  bool called = false;
  std::optional<std::string> received;
  h.coordinator->NarrateAsync(game_id, "Open the desk",
                              [&](bool ok, std::optional<std::string> content, OpError error) {
                                EXPECT_TRUE(ok) << error.code;
                                called = true;
                                received = std::move(content);
                              });
  // 호출 스레드에서는 제공자에 닿지 않는다.
  EXPECT_FALSE(called);
  EXPECT_TRUE(h.provider->Prompts().empty());

  h.ioc.run();

  ASSERT_TRUE(called);
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(*received, "The fog thickens.");
  ASSERT_EQ(h.provider->Prompts().size(), 1u);
  EXPECT_EQ(connections[1]->FramesOfType("narration").size(), 1u);
}

TEST_F(CoordinatorFixture, NarrateAsyncReportsUnknownGame) {
  bool called = false;
  h.coordinator->NarrateAsync("deadbeef", "", [&](bool ok, std::optional<std::string> content, OpError error) {
    called = true;
    EXPECT_FALSE(ok);
    EXPECT_FALSE(content.has_value());
    EXPECT_EQ(error.code, "game_not_found");
  });
  h.ioc.run();
  EXPECT_TRUE(called);
}

TEST_F(CoordinatorFixture, PhaseChangeEchoWaitsForAdvanceLock) {
  StartGame();
  auto lock_ptr = h.locks->For(game_id);
  std::unique_lock<std::mutex> held(*lock_ptr);
  std::thread echo([&]() {
    h.coordinator->HandleMessage(game_id, players[0],
                                 R"({"type":"phase_change","payload":{"phase":"script_reading"}})");
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_TRUE(connections[1]->FramesOfType("phase_change").empty());
  held.unlock();
  echo.join();
  EXPECT_EQ(connections[1]->FramesOfType("phase_change").size(), 1u);
}

TEST_F(CoordinatorFixture, NarrateInLobbyProducesNothing) {
  std::optional<std::string> content;
  OpError error;
  ASSERT_TRUE(h.coordinator->Narrate(game_id, "", content, error));
  EXPECT_FALSE(content.has_value());
  EXPECT_TRUE(h.provider->Prompts().empty());
  EXPECT_TRUE(connections[0]->FramesOfType("narration").empty());
}

TEST_F(CoordinatorFixture, NarrationFallbackIsStillBroadcast) {
  StartGame();
  h.provider->SetFail(true);
  std::optional<std::string> content;
  OpError error;
  ASSERT_TRUE(h.coordinator->Narrate(game_id, "", content, error));
  ASSERT_TRUE(content.has_value());
  EXPECT_EQ(*content, mystery::kNarrationFallback);
  EXPECT_EQ(connections[3]->FramesOfType("narration").size(), 1u);
}

TEST_F(CoordinatorFixture, AnnouncePhaseBroadcasts) {
  h.coordinator->AnnouncePhase(game_id, GamePhase::kInvestigation);
  for (const auto& connection : connections) {
    auto changes = connection->FramesOfType("phase_change");
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0]["payload"]["phase"], "investigation");
  }
}

TEST(GameCoordinatorTest, NarrateUnknownGameFails) {
  testing_support::Harness h;
  std::optional<std::string> content;
  OpError error;
  EXPECT_FALSE(h.coordinator->Narrate("deadbeef", "", content, error));
  EXPECT_EQ(error.code, "game_not_found");
}
