/*
 * 설명: 실시간 메시지 분배, 접속/해제 알림, 단계 알림, 내레이션 생성 흐름을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_coordinator_test.cpp
 */
#include "mystery/game_coordinator.hpp"

#include <exception>
#include <mutex>

#include <boost/asio/post.hpp>

#include "mystery/api_response.hpp"

namespace mystery {

namespace {
std::optional<std::string> OptionalString(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}
}  // namespace

GameCoordinator::GameCoordinator(boost::asio::any_io_executor narration_executor, CoordinatorDeps deps,
                                 bool narrate_on_phase_change)
    : narration_executor_(std::move(narration_executor)),
      deps_(std::move(deps)),
      narrate_on_phase_change_(narrate_on_phase_change) {}

bool GameCoordinator::OnConnect(const std::string& game_id, const std::string& player_id,
                                const std::shared_ptr<ConnectionHandle>& handle, OpError& error) {
  if (!deps_.registry->Connect(game_id, player_id, handle, error)) {
    return false;
  }
  auto player = deps_.store->FindPlayer(game_id, player_id);
  const std::string name = player ? player->name : "Unknown";
  deps_.registry->Broadcast(
      game_id,
      ToWsJson(WsEnvelope{.type = "player_joined", .payload = {{"player_id", player_id}, {"player_name", name}}}),
      player_id);
  return true;
}

void GameCoordinator::OnDisconnect(const std::string& game_id, const std::string& player_id,
                                   const ConnectionHandle* handle) {
  try {
    if (!deps_.registry->Disconnect(game_id, player_id, handle)) {
      return;
    }
    auto player = deps_.store->FindPlayer(game_id, player_id);
    const std::string name = player ? player->name : "Unknown";
    deps_.registry->Broadcast(
        game_id,
        ToWsJson(WsEnvelope{.type = "player_left", .payload = {{"player_id", player_id}, {"player_name", name}}}),
        player_id);
  } catch (const std::exception& ex) {
    deps_.observability->LogEvent(LogLevel::kError, "disconnect_failed",
                                  {{"gameId", game_id}, {"playerId", player_id}, {"reason", ex.what()}});
  }
}

void GameCoordinator::HandleMessage(const std::string& game_id, const std::string& player_id,
                                    const std::string& raw) {
  WsEnvelope envelope;
  try {
    envelope = ParseWsEnvelope(nlohmann::json::parse(raw));
  } catch (const std::exception&) {
    SendError(game_id, player_id, "bad_request", "잘못된 메시지 형식");
    return;
  }

  try {
    Dispatch(game_id, player_id, envelope.type, envelope.payload);
  } catch (const std::exception& ex) {
    deps_.observability->IncrementError();
    deps_.observability->LogEvent(
        LogLevel::kError, "message_failed",
        {{"gameId", game_id}, {"playerId", player_id}, {"type", envelope.type}, {"reason", ex.what()}});
    SendError(game_id, player_id, "internal_error", "메시지 처리 중 오류가 발생했습니다");
  }
}

void GameCoordinator::Dispatch(const std::string& game_id, const std::string& player_id, const std::string& type,
                               const nlohmann::json& payload) {
  OpError error;
  if (type == "chat") {
    auto content = OptionalString(payload, "content");
    if (!deps_.chat->PostChat(game_id, player_id, content.value_or(""), error)) {
      SendError(game_id, player_id, error.code, error.message);
    }
    return;
  }
  if (type == "search") {
    auto location = OptionalString(payload, "location_id");
    if (!location) {
      SendError(game_id, player_id, "bad_request", "location_id가 필요합니다");
      return;
    }
    SearchRequest request{.game_id = game_id,
                          .player_id = player_id,
                          .location_id = *location,
                          .item = OptionalString(payload, "item")};
    std::optional<DiscoveredClue> discovered;
    if (!deps_.clues->Search(request, discovered, error)) {
      SendError(game_id, player_id, error.code, error.message);
    }
    return;
  }
  if (type == "phase_change") {
    HandlePhaseChange(game_id, player_id, payload);
    return;
  }
  if (type == "vote") {
    auto suspect = OptionalString(payload, "suspect_id");
    if (!suspect) {
      SendError(game_id, player_id, "bad_request", "suspect_id가 필요합니다");
      return;
    }
    if (!deps_.votes->CastVote(game_id, player_id, *suspect, error)) {
      SendError(game_id, player_id, error.code, error.message);
    }
    return;
  }
  if (type == "gm_request") {
    if (!deps_.store->FindPlayer(game_id, player_id)) {
      SendError(game_id, player_id, "player_not_found", "플레이어를 찾을 수 없습니다");
      return;
    }
    ScheduleNarration(game_id, OptionalString(payload, "action").value_or(""));
    return;
  }
  SendError(game_id, player_id, "bad_request", "알 수 없는 메시지 유형");
}

void GameCoordinator::HandlePhaseChange(const std::string& game_id, const std::string& player_id,
                                        const nlohmann::json& payload) {
  if (!deps_.store->FindGame(game_id)) {
    SendError(game_id, player_id, "game_not_found", "게임을 찾을 수 없습니다");
    return;
  }
  // 단계 진행 알림과 같은 세션 잠금 아래에서 읽고 브로드캐스트한다.
  auto lock_ptr = deps_.locks->For(game_id);
  std::lock_guard<std::mutex> lock(*lock_ptr);
  auto game = deps_.store->FindGame(game_id);
  if (!game) {
    SendError(game_id, player_id, "game_not_found", "게임을 찾을 수 없습니다");
    return;
  }
  if (game->host_id != player_id) {
    SendError(game_id, player_id, "unauthorized", "호스트만 단계 변경을 알릴 수 있습니다");
    return;
  }
  auto claimed = OptionalString(payload, "phase");
  if (!claimed) {
    SendError(game_id, player_id, "bad_request", "phase가 필요합니다");
    return;
  }
  auto parsed = ParsePhase(*claimed);
  if (!parsed || *parsed != game->phase) {
    SendError(game_id, player_id, "phase_mismatch", "현재 단계와 일치하지 않습니다");
    return;
  }
  deps_.registry->Broadcast(game_id,
                            ToWsJson(WsEnvelope{.type = "phase_change", .payload = {{"phase", ToString(game->phase)}}}));
}

void GameCoordinator::AnnouncePhase(const std::string& game_id, GamePhase phase) {
  deps_.observability->LogEvent(LogLevel::kInfo, "phase_changed", {{"gameId", game_id}, {"phase", ToString(phase)}});
  deps_.registry->Broadcast(game_id,
                            ToWsJson(WsEnvelope{.type = "phase_change", .payload = {{"phase", ToString(phase)}}}));
  if (narrate_on_phase_change_) {
    ScheduleNarration(game_id, "");
  }
}

void GameCoordinator::ScheduleNarration(const std::string& game_id, const std::string& action) {
  auto self = shared_from_this();
  NarrateAsync(game_id, action, [self, game_id](bool ok, std::optional<std::string>, OpError error) {
    if (!ok) {
      self->deps_.observability->LogEvent(LogLevel::kWarn, "narration_skipped",
                                          {{"gameId", game_id}, {"code", error.code}});
    }
  });
}

void GameCoordinator::NarrateAsync(const std::string& game_id, const std::string& action, NarrationDone done) {
  auto self = shared_from_this();
  boost::asio::post(narration_executor_, [self, game_id, action, done = std::move(done)]() {
    std::optional<std::string> content;
    OpError error;
    bool ok = false;
    try {
      ok = self->Narrate(game_id, action, content, error);
    } catch (const std::exception& ex) {
      self->deps_.observability->IncrementError();
      self->deps_.observability->LogEvent(LogLevel::kError, "narration_failed",
                                          {{"gameId", game_id}, {"reason", ex.what()}});
      content.reset();
      error.Set(ErrorKind::kInternal, "internal_error", "내레이션 생성 중 오류가 발생했습니다");
    }
    done(ok, std::move(content), std::move(error));
  });
}

bool GameCoordinator::Narrate(const std::string& game_id, const std::string& action,
                              std::optional<std::string>& content, OpError& error) {
  content.reset();
  auto game = deps_.store->FindGame(game_id);
  if (!game) {
    error.Set(ErrorKind::kNotFound, "game_not_found", "게임을 찾을 수 없습니다");
    return false;
  }

  NarrationRequest request{.story_id = game->story_id,
                           .phase = game->phase,
                           .players = {},
                           .found_clue_ids = {},
                           .recent_messages = {},
                           .action = action};
  for (const auto& player : deps_.store->ListPlayers(game_id)) {
    request.players.push_back(NarrationPlayer{.name = player.name, .character_id = player.character_id});
  }
  for (const auto& found : deps_.store->ListFoundClues(game_id)) {
    request.found_clue_ids.push_back(found.clue_id);
  }
  for (const auto& message : deps_.store->RecentMessages(game_id, kNarrationHistoryLimit)) {
    request.recent_messages.push_back(NarrationMessage{.sender_name = message.sender_name,
                                                       .content = message.content,
                                                       .is_chat = message.kind == MessageKind::kChat});
  }

  // 제공자 호출 동안 세션 잠금을 쥐지 않는다.
  content = deps_.narrator->Narrate(request);
  if (!content) {
    return true;
  }
  deps_.chat->AppendSystem(game_id, *content);
  deps_.registry->Broadcast(
      game_id,
      ToWsJson(WsEnvelope{.type = "narration", .payload = {{"phase", ToString(game->phase)}, {"content", *content}}}));
  return true;
}

void GameCoordinator::SendError(const std::string& game_id, const std::string& player_id, const std::string& code,
                                const std::string& message) {
  deps_.registry->SendToPlayer(
      game_id, player_id, ToWsJson(WsEnvelope{.type = "error", .payload = {{"code", code}, {"message", message}}}));
}

}  // namespace mystery
