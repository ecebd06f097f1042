/*
 * 설명: 세션 채팅 로그(추가 전용)와 채팅 브로드캐스트를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chat_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mystery/errors.hpp"
#include "mystery/game_store.hpp"
#include "mystery/realtime.hpp"

namespace mystery {

inline constexpr const char* kGameMasterName = "Game Master";

class ChatService {
 public:
  ChatService(std::shared_ptr<GameStore> store, std::shared_ptr<ConnectionRegistry> registry);

  std::optional<ChatMessageRecord> PostChat(const std::string& game_id, const std::string& player_id,
                                            const std::string& content, OpError& error);
  // 브로드캐스트 없이 시스템 메시지를 기록한다.
  ChatMessageRecord AppendSystem(const std::string& game_id, const std::string& content);
  std::optional<std::vector<ChatMessageRecord>> RecentMessages(const std::string& game_id, std::size_t limit,
                                                               OpError& error);

 private:
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<ConnectionRegistry> registry_;
};

}  // namespace mystery
