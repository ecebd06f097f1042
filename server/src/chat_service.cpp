/*
 * 설명: 채팅 메시지를 기록하고 세션 전체에 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chat_service_test.cpp
 */
#include "mystery/chat_service.hpp"

#include <chrono>

#include "mystery/api_response.hpp"

namespace mystery {

ChatService::ChatService(std::shared_ptr<GameStore> store, std::shared_ptr<ConnectionRegistry> registry)
    : store_(std::move(store)), registry_(std::move(registry)) {}

std::optional<ChatMessageRecord> ChatService::PostChat(const std::string& game_id, const std::string& player_id,
                                                       const std::string& content, OpError& error) {
  if (content.empty()) {
    error.Set(ErrorKind::kBadRequest, "bad_request", "메시지 내용이 비어 있습니다");
    return std::nullopt;
  }
  auto player = store_->FindPlayer(game_id, player_id);
  if (!player) {
    error.Set(ErrorKind::kNotFound, "player_not_found", "플레이어를 찾을 수 없습니다");
    return std::nullopt;
  }

  auto stored = store_->AppendMessage(ChatMessageRecord{.id = 0,
                                                        .game_id = game_id,
                                                        .player_id = player_id,
                                                        .sender_name = player->name,
                                                        .content = content,
                                                        .kind = MessageKind::kChat,
                                                        .created_at = std::chrono::system_clock::now()});
  registry_->Broadcast(game_id, ToWsJson(WsEnvelope{.type = "chat",
                                                    .payload = {{"sender_id", player_id},
                                                                {"sender_name", player->name},
                                                                {"content", content}}}));
  return stored;
}

ChatMessageRecord ChatService::AppendSystem(const std::string& game_id, const std::string& content) {
  return store_->AppendMessage(ChatMessageRecord{.id = 0,
                                                 .game_id = game_id,
                                                 .player_id = std::nullopt,
                                                 .sender_name = kGameMasterName,
                                                 .content = content,
                                                 .kind = MessageKind::kSystem,
                                                 .created_at = std::chrono::system_clock::now()});
}

std::optional<std::vector<ChatMessageRecord>> ChatService::RecentMessages(const std::string& game_id,
                                                                          std::size_t limit, OpError& error) {
  if (!store_->FindGame(game_id)) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return std::nullopt;
  }
  return store_->RecentMessages(game_id, limit);
}

}  // namespace mystery
