#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "unit/test_support.hpp"

using testing_support::FakeConnection;

namespace {
nlohmann::json Event(const std::string& type) { return {{"type", type}, {"payload", nlohmann::json::object()}}; }
}  // namespace

TEST(ConnectionRegistryTest, ConnectUnknownSessionFails) {
  testing_support::Harness h;
  auto conn = std::make_shared<FakeConnection>();
  mystery::OpError error;
  EXPECT_FALSE(h.registry->Connect("nope", "player", conn, error));
  EXPECT_EQ(error.kind, mystery::ErrorKind::kNotFound);
  EXPECT_EQ(error.code, "session_not_found");
  EXPECT_FALSE(h.registry->HasArena("nope"));
}

TEST(ConnectionRegistryTest, ConnectUnknownPlayerFails) {
  testing_support::Harness h;
  std::string game_id;
  h.SeedGame(4, game_id);
  mystery::OpError error;
  EXPECT_FALSE(h.registry->Connect(game_id, "ghost", std::make_shared<FakeConnection>(), error));
  EXPECT_EQ(error.code, "player_not_found");
}

TEST(ConnectionRegistryTest, ConnectAndDisconnectToggleFlag) {
  testing_support::Harness h;
  std::string game_id;
  auto players = h.SeedGame(4, game_id);
  EXPECT_FALSE(h.store->FindPlayer(game_id, players[1])->is_connected);

  auto conn = std::make_shared<FakeConnection>();
  mystery::OpError error;
  ASSERT_TRUE(h.registry->Connect(game_id, players[1], conn, error));
  EXPECT_TRUE(h.store->FindPlayer(game_id, players[1])->is_connected);
  EXPECT_EQ(h.registry->ActiveConnections(), 1u);

  EXPECT_TRUE(h.registry->Disconnect(game_id, players[1], conn.get()));
  EXPECT_FALSE(h.store->FindPlayer(game_id, players[1])->is_connected);
  EXPECT_EQ(h.registry->ActiveConnections(), 0u);
  // 비어 있는 영역은 제거된다.
  EXPECT_FALSE(h.registry->HasArena(game_id));
}

TEST(ConnectionRegistryTest, ReconnectReplacesHandleAndIgnoresStaleDisconnect) {
  testing_support::Harness h;
  std::string game_id;
  auto players = h.SeedGame(4, game_id);
  auto first = std::make_shared<FakeConnection>();
  auto second = std::make_shared<FakeConnection>();
  mystery::OpError error;
  ASSERT_TRUE(h.registry->Connect(game_id, players[0], first, error));
  ASSERT_TRUE(h.registry->Connect(game_id, players[0], second, error));

  EXPECT_FALSE(h.registry->Disconnect(game_id, players[0], first.get()));
  EXPECT_TRUE(h.store->FindPlayer(game_id, players[0])->is_connected);

  h.registry->Broadcast(game_id, Event("ping"));
  EXPECT_TRUE(first->Frames().empty());
  EXPECT_EQ(second->Frames().size(), 1u);
}

TEST(ConnectionRegistryTest, BroadcastHonoursExclude) {
  testing_support::Harness h;
  std::string game_id;
  auto players = h.SeedGame(4, game_id);
  std::vector<std::shared_ptr<FakeConnection>> conns;
  mystery::OpError error;
  for (const auto& player : players) {
    conns.push_back(std::make_shared<FakeConnection>());
    ASSERT_TRUE(h.registry->Connect(game_id, player, conns.back(), error));
  }

  h.registry->Broadcast(game_id, Event("chat"), players[2]);
  for (std::size_t i = 0; i < conns.size(); ++i) {
    EXPECT_EQ(conns[i]->Frames().size(), i == 2 ? 0u : 1u);
  }
}

TEST(ConnectionRegistryTest, FailingRecipientIsSkipped) {
  testing_support::Harness h;
  std::string game_id;
  auto players = h.SeedGame(4, game_id);
  auto broken = std::make_shared<FakeConnection>();
  auto healthy = std::make_shared<FakeConnection>();
  broken->SetFail(true);
  mystery::OpError error;
  ASSERT_TRUE(h.registry->Connect(game_id, players[0], broken, error));
  ASSERT_TRUE(h.registry->Connect(game_id, players[1], healthy, error));

  EXPECT_NO_THROW(h.registry->Broadcast(game_id, Event("chat")));
  EXPECT_EQ(healthy->Frames().size(), 1u);
  EXPECT_EQ(h.observability->Snapshot().transport_failures, 1u);
}

TEST(ConnectionRegistryTest, SendToPlayerWithoutHandleIsNoop) {
  testing_support::Harness h;
  std::string game_id;
  auto players = h.SeedGame(4, game_id);
  auto conn = std::make_shared<FakeConnection>();
  mystery::OpError error;
  ASSERT_TRUE(h.registry->Connect(game_id, players[0], conn, error));

  EXPECT_NO_THROW(h.registry->SendToPlayer(game_id, players[1], Event("error")));
  h.registry->SendToPlayer(game_id, players[0], Event("error"));
  EXPECT_EQ(conn->FramesOfType("error").size(), 1u);
}

TEST(ConnectionRegistryTest, BroadcastOrderIsSharedByAllRecipients) {
  testing_support::Harness h;
  std::string game_id;
  auto players = h.SeedGame(4, game_id);
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  mystery::OpError error;
  ASSERT_TRUE(h.registry->Connect(game_id, players[0], a, error));
  ASSERT_TRUE(h.registry->Connect(game_id, players[1], b, error));

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&h, &game_id, t]() {
      for (int i = 0; i < 25; ++i) {
        h.registry->Broadcast(game_id, {{"type", "tick"}, {"payload", {{"n", t * 100 + i}}}});
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  auto fa = a->Frames();
  auto fb = b->Frames();
  ASSERT_EQ(fa.size(), 100u);
  EXPECT_EQ(fa, fb);
}

TEST(ConnectionRegistryTest, ExpiredHandleIsSkipped) {
  testing_support::Harness h;
  std::string game_id;
  auto players = h.SeedGame(4, game_id);
  auto keeper = std::make_shared<FakeConnection>();
  mystery::OpError error;
  {
    auto temporary = std::make_shared<FakeConnection>();
    ASSERT_TRUE(h.registry->Connect(game_id, players[0], temporary, error));
  }
  ASSERT_TRUE(h.registry->Connect(game_id, players[1], keeper, error));
  EXPECT_NO_THROW(h.registry->Broadcast(game_id, Event("chat")));
  EXPECT_EQ(keeper->Frames().size(), 1u);
}
