/*
 * 설명: 게임 세션별 (플레이어 → 전송 핸들) 영역을 관리하고 브로드캐스트/유니캐스트를 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "mystery/errors.hpp"
#include "mystery/game_store.hpp"
#include "mystery/observability.hpp"

namespace mystery {

// 전송 계층 연결. Deliver는 블로킹하지 않아야 하며 실패 시 예외를 던질 수 있다.
class ConnectionHandle {
 public:
  virtual ~ConnectionHandle() = default;
  virtual void Deliver(const std::string& frame) = 0;
};

class ConnectionRegistry {
 public:
  ConnectionRegistry(std::shared_ptr<GameStore> store, std::shared_ptr<Observability> observability);

  // 기존 핸들은 교체된다(재접속).
  bool Connect(const std::string& game_id, const std::string& player_id,
               const std::shared_ptr<ConnectionHandle>& handle, OpError& error);
  // 등록된 핸들과 다르면(재접속으로 교체된 경우) 무시하고 false를 반환한다.
  bool Disconnect(const std::string& game_id, const std::string& player_id, const ConnectionHandle* handle);

  void Broadcast(const std::string& game_id, const nlohmann::json& message,
                 const std::optional<std::string>& exclude = std::nullopt);
  void SendToPlayer(const std::string& game_id, const std::string& player_id, const nlohmann::json& message);

  std::vector<std::string> ConnectedPlayers(const std::string& game_id) const;
  std::size_t ActiveConnections() const;
  bool HasArena(const std::string& game_id) const;

 private:
  struct Entry {
    std::weak_ptr<ConnectionHandle> handle;
    const ConnectionHandle* raw{nullptr};
  };

  struct Arena {
    std::mutex mutex;
    bool retired{false};
    std::map<std::string, Entry> entries;
  };

  std::shared_ptr<Arena> FindArena(const std::string& game_id) const;
  std::shared_ptr<Arena> AcquireArena(const std::string& game_id);
  void RetireIfEmpty(const std::string& game_id, const std::shared_ptr<Arena>& arena);
  void DeliverTo(const std::string& game_id, const std::string& player_id, const Entry& entry,
                 const std::string& frame);
  void PublishActiveCount();

  std::shared_ptr<GameStore> store_;
  std::shared_ptr<Observability> observability_;
  std::unordered_map<std::string, std::shared_ptr<Arena>> arenas_;
  mutable std::mutex mutex_;
};

}  // namespace mystery
