/*
 * 설명: 세션별 연결 영역을 관리하고 서버 이벤트를 안전하게 전달한다.
 *       잠금 순서: 레지스트리 → 영역 → 저장소.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "mystery/realtime.hpp"

#include <exception>

namespace mystery {

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<GameStore> store, std::shared_ptr<Observability> observability)
    : store_(std::move(store)), observability_(std::move(observability)) {}

std::shared_ptr<ConnectionRegistry::Arena> ConnectionRegistry::FindArena(const std::string& game_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = arenas_.find(game_id);
  if (it == arenas_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<ConnectionRegistry::Arena> ConnectionRegistry::AcquireArena(const std::string& game_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& arena = arenas_[game_id];
  if (!arena) {
    arena = std::make_shared<Arena>();
  }
  return arena;
}

bool ConnectionRegistry::Connect(const std::string& game_id, const std::string& player_id,
                                 const std::shared_ptr<ConnectionHandle>& handle, OpError& error) {
  if (!store_->FindGame(game_id)) {
    error.Set(ErrorKind::kNotFound, "session_not_found", "게임 세션을 찾을 수 없습니다");
    return false;
  }
  if (!store_->FindPlayer(game_id, player_id)) {
    error.Set(ErrorKind::kNotFound, "player_not_found", "플레이어를 찾을 수 없습니다");
    return false;
  }

  // 비어서 제거 중인 영역을 잡았다면 새 영역으로 다시 시도한다.
  while (true) {
    auto arena = AcquireArena(game_id);
    std::lock_guard<std::mutex> lock(arena->mutex);
    if (arena->retired) {
      continue;
    }
    arena->entries[player_id] = Entry{handle, handle.get()};
    store_->SetConnected(game_id, player_id, true);
    break;
  }
  PublishActiveCount();
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "player_connected", {{"gameId", game_id}, {"playerId", player_id}});
  }
  return true;
}

bool ConnectionRegistry::Disconnect(const std::string& game_id, const std::string& player_id,
                                    const ConnectionHandle* handle) {
  auto arena = FindArena(game_id);
  if (!arena) {
    return false;
  }
  bool now_empty = false;
  {
    std::lock_guard<std::mutex> lock(arena->mutex);
    auto it = arena->entries.find(player_id);
    if (it == arena->entries.end() || it->second.raw != handle) {
      return false;
    }
    arena->entries.erase(it);
    store_->SetConnected(game_id, player_id, false);
    now_empty = arena->entries.empty();
  }
  if (now_empty) {
    RetireIfEmpty(game_id, arena);
  }
  PublishActiveCount();
  if (observability_) {
    observability_->LogEvent(LogLevel::kInfo, "player_disconnected", {{"gameId", game_id}, {"playerId", player_id}});
  }
  return true;
}

void ConnectionRegistry::RetireIfEmpty(const std::string& game_id, const std::shared_ptr<Arena>& arena) {
  std::lock_guard<std::mutex> registry_lock(mutex_);
  auto it = arenas_.find(game_id);
  if (it == arenas_.end() || it->second != arena) {
    return;
  }
  std::lock_guard<std::mutex> arena_lock(arena->mutex);
  if (!arena->entries.empty()) {
    return;
  }
  arena->retired = true;
  arenas_.erase(it);
}

void ConnectionRegistry::DeliverTo(const std::string& game_id, const std::string& player_id, const Entry& entry,
                                   const std::string& frame) {
  auto handle = entry.handle.lock();
  if (!handle) {
    return;
  }
  try {
    handle->Deliver(frame);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->IncrementTransportFailure();
      observability_->LogEvent(LogLevel::kWarn, "transport_failure",
                               {{"gameId", game_id}, {"playerId", player_id}, {"reason", ex.what()}});
    }
  }
}

void ConnectionRegistry::Broadcast(const std::string& game_id, const nlohmann::json& message,
                                   const std::optional<std::string>& exclude) {
  auto arena = FindArena(game_id);
  if (!arena) {
    return;
  }
  const std::string frame = message.dump();
  // 영역 잠금을 쥔 채로 큐에 넣어 같은 세션의 브로드캐스트 순서를 모든 수신자가 동일하게 본다.
  std::lock_guard<std::mutex> lock(arena->mutex);
  for (const auto& [player_id, entry] : arena->entries) {
    if (exclude && *exclude == player_id) {
      continue;
    }
    DeliverTo(game_id, player_id, entry, frame);
  }
}

void ConnectionRegistry::SendToPlayer(const std::string& game_id, const std::string& player_id,
                                      const nlohmann::json& message) {
  auto arena = FindArena(game_id);
  if (!arena) {
    return;
  }
  std::lock_guard<std::mutex> lock(arena->mutex);
  auto it = arena->entries.find(player_id);
  if (it == arena->entries.end()) {
    return;
  }
  DeliverTo(game_id, player_id, it->second, message.dump());
}

std::vector<std::string> ConnectionRegistry::ConnectedPlayers(const std::string& game_id) const {
  std::vector<std::string> players;
  auto arena = FindArena(game_id);
  if (!arena) {
    return players;
  }
  std::lock_guard<std::mutex> lock(arena->mutex);
  for (const auto& [player_id, entry] : arena->entries) {
    players.push_back(player_id);
  }
  return players;
}

std::size_t ConnectionRegistry::ActiveConnections() const {
  std::vector<std::shared_ptr<Arena>> arenas;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [game_id, arena] : arenas_) {
      arenas.push_back(arena);
    }
  }
  std::size_t total = 0;
  for (const auto& arena : arenas) {
    std::lock_guard<std::mutex> lock(arena->mutex);
    total += arena->entries.size();
  }
  return total;
}

bool ConnectionRegistry::HasArena(const std::string& game_id) const { return FindArena(game_id) != nullptr; }

void ConnectionRegistry::PublishActiveCount() {
  if (observability_) {
    observability_->SetWebsocketActive(ActiveConnections());
  }
}

}  // namespace mystery
