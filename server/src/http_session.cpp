/*
 * 설명: HTTP 요청을 게임 로비/진행 연산으로 분기하고 WS 업그레이드를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "mystery/http_session.hpp"

#include <chrono>
#include <optional>
#include <unordered_map>

#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "mystery/api_response.hpp"
#include "mystery/db_client.hpp"
#include "mystery/websocket_session.hpp"

namespace mystery {

namespace http = boost::beast::http;

namespace {
constexpr std::size_t kDefaultMessageLimit = 50;

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && eq + 1 <= pair.size()) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stoul(value, &idx);
    if (idx != value.size() || parsed == 0) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// 필드가 문자열이 아니면 std::invalid_argument
std::string RequireString(const nlohmann::json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end() || !it->is_string()) {
    throw std::invalid_argument(std::string(key) + " 필드가 필요합니다");
  }
  return it->get<std::string>();
}

nlohmann::json OptionalToJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json SnapshotToJson(const GameSnapshot& snapshot) {
  nlohmann::json players = nlohmann::json::array();
  for (const auto& player : snapshot.players) {
    players.push_back({{"id", player.id},
                       {"name", player.name},
                       {"character_id", OptionalToJson(player.character_id)},
                       {"character_name", OptionalToJson(player.character_name)},
                       {"is_host", player.is_host},
                       {"is_connected", player.is_connected}});
  }
  return {{"id", snapshot.game.id},
          {"story_id", snapshot.game.story_id},
          {"story_title", snapshot.story_title},
          {"status", ToString(snapshot.game.status)},
          {"phase", ToString(snapshot.game.phase)},
          {"players", players},
          {"host_id", snapshot.game.host_id},
          {"created_at", ToIsoString(snapshot.game.created_at)}};
}

nlohmann::json CharactersToJson(const std::vector<CharacterView>& characters) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& character : characters) {
    out.push_back({{"id", character.id},
                   {"name", character.name},
                   {"name_cn", character.name_cn},
                   {"public_info", character.public_info},
                   {"is_taken", character.is_taken}});
  }
  return out;
}

nlohmann::json PrivateCharacterToJson(const CharacterRecord& character) {
  return {{"id", character.id},
          {"name", character.name},
          {"name_cn", character.name_cn},
          {"public_info", character.public_info},
          {"private_info",
           {{"background", character.private_background},
            {"secrets", character.secrets},
            {"relationships", character.relationships},
            {"goals", character.goals}}}};
}

nlohmann::json CluesToJson(const std::vector<DiscoveredClue>& clues) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& clue : clues) {
    out.push_back({{"id", clue.id},
                   {"name", clue.name},
                   {"description", clue.description},
                   {"location", clue.location},
                   {"found_by", clue.found_by},
                   {"finder_name", clue.finder_name},
                   {"found_at", ToIsoString(clue.found_at)}});
  }
  return out;
}

nlohmann::json MessagesToJson(const std::vector<ChatMessageRecord>& messages) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& message : messages) {
    out.push_back({{"id", message.id},
                   {"player_id", OptionalToJson(message.player_id)},
                   {"sender_name", message.sender_name},
                   {"content", message.content},
                   {"message_type", message.kind == MessageKind::kChat ? "chat" : "system"},
                   {"created_at", ToIsoString(message.created_at)}});
  }
  return out;
}
}  // namespace

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos < path.size()) {
    auto slash = path.find('/', pos);
    auto end = slash == std::string::npos ? path.size() : slash;
    if (end > pos) {
      segments.push_back(path.substr(pos, end - pos));
    }
    pos = end + 1;
  }
  return segments;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<GameService> game_service,
                         std::shared_ptr<PhaseStateMachine> phases,
                         std::shared_ptr<ClueProtocol> clues,
                         std::shared_ptr<ChatService> chat,
                         std::shared_ptr<GameCoordinator> coordinator,
                         std::shared_ptr<ConnectionRegistry> registry,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), game_service_(std::move(game_service)),
      phases_(std::move(phases)), clues_(std::move(clues)), chat_(std::move(chat)),
      coordinator_(std::move(coordinator)), registry_(std::move(registry)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::Reply(const std::shared_ptr<Response>& res, http::status status, const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::ReplyError(const std::shared_ptr<Response>& res, const OpError& error) {
  Reply(res, static_cast<http::status>(HttpStatusFor(error.kind)), MakeErrorEnvelope(error.code, error.message));
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  log_game_id_.reset();
  log_player_id_.reset();
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "mystery-coordinator");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"game", {{"cluesFound", snapshot.clues_found}, {"votesCast", snapshot.votes_cast}}},
                        {"narration",
                         {{"total", snapshot.narrations}, {"failures", snapshot.narration_failures}}},
                        {"transport", {{"failures", snapshot.transport_failures}}}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  auto segments = SplitPath(path);
  if (segments.size() >= 2 && segments[0] == "api" && segments[1] == "games") {
    try {
      return RouteGame(res, segments, query);
    } catch (const DbException& ex) {
      if (observability_) {
        observability_->LogEvent(LogLevel::kError, "db_failure", {{"traceId", trace_id_}, {"reason", ex.what()}});
      }
      return Reply(res, http::status::internal_server_error,
                   MakeErrorEnvelope("internal_error", "저장소 처리 중 오류가 발생했습니다"));
    } catch (const nlohmann::json::exception&) {
      return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
    } catch (const std::invalid_argument& ex) {
      return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", ex.what()));
    }
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::RouteGame(const std::shared_ptr<Response>& res, const std::vector<std::string>& segments,
                            const std::string& query) {
  const auto method = req_.method();
  OpError error;

  if (segments.size() == 2 && method == http::verb::post) {
    auto body = nlohmann::json::parse(req_.body());
    auto created = game_service_->CreateGame(RequireString(body, "story_id"), RequireString(body, "host_name"), error);
    if (!created) {
      return ReplyError(res, error);
    }
    log_game_id_ = created->game_id;
    nlohmann::json data{{"game_id", created->game_id},
                        {"player_id", created->host_player_id},
                        {"message", "Game created! Share code: " + created->game_id}};
    return Reply(res, http::status::created, MakeSuccessEnvelope(data));
  }
  if (segments.size() < 3) {
    return Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }

  const std::string& game_id = segments[2];
  const std::string action = segments.size() >= 4 ? segments[3] : std::string{};
  log_game_id_ = game_id;
  auto params = ParseQueryParams(query);

  if (segments.size() == 3 && method == http::verb::get) {
    auto snapshot = game_service_->Snapshot(game_id, error);
    if (!snapshot) {
      return ReplyError(res, error);
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope(SnapshotToJson(*snapshot)));
  }

  if (segments.size() == 4 && action == "join" && method == http::verb::post) {
    auto body = nlohmann::json::parse(req_.body());
    auto player_name = RequireString(body, "player_name");
    auto player_id = game_service_->JoinGame(game_id, player_name, error);
    if (!player_id) {
      return ReplyError(res, error);
    }
    log_player_id_ = *player_id;
    nlohmann::json data{
        {"player_id", *player_id}, {"game_id", game_id}, {"message", "Joined game as " + player_name}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (segments.size() == 4 && action == "characters" && method == http::verb::get) {
    auto characters = game_service_->ListCharacters(game_id, error);
    if (!characters) {
      return ReplyError(res, error);
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope(CharactersToJson(*characters)));
  }

  if (segments.size() == 4 && action == "select-character" && method == http::verb::post) {
    auto body = nlohmann::json::parse(req_.body());
    auto player_id = RequireString(body, "player_id");
    auto character_id = RequireString(body, "character_id");
    log_player_id_ = player_id;
    if (!game_service_->SelectCharacter(game_id, player_id, character_id, error)) {
      return ReplyError(res, error);
    }
    nlohmann::json data{{"message", "Selected character: " + character_id}, {"character_id", character_id}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (segments.size() == 4 && (action == "start" || action == "phase") && method == http::verb::post) {
    auto player_it = params.find("player_id");
    if (player_it == params.end()) {
      return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "player_id가 필요합니다"));
    }
    log_player_id_ = player_it->second;
    // 알림은 단계 기록과 같은 세션 잠금 안에서 나간다.
    auto announce = [this, &game_id](GamePhase committed) { coordinator_->AnnouncePhase(game_id, committed); };
    auto phase = action == "start" ? phases_->Start(game_id, player_it->second, error, announce)
                                   : phases_->Advance(game_id, player_it->second, error, announce);
    if (!phase) {
      return ReplyError(res, error);
    }
    const std::string label(ToString(*phase));
    nlohmann::json data{
        {"message", action == "start" ? std::string("Game started!") : "Advanced to " + label}, {"phase", label}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (segments.size() == 5 && action == "my-character" && method == http::verb::get) {
    log_player_id_ = segments[4];
    auto character = game_service_->MyCharacter(game_id, segments[4], error);
    if (!character) {
      return ReplyError(res, error);
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope(PrivateCharacterToJson(*character)));
  }

  if (segments.size() == 4 && action == "clues" && method == http::verb::get) {
    auto clues = clues_->FoundClues(game_id, error);
    if (!clues) {
      return ReplyError(res, error);
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope(CluesToJson(*clues)));
  }

  if (segments.size() == 4 && action == "messages" && method == http::verb::get) {
    std::size_t limit = kDefaultMessageLimit;
    auto limit_it = params.find("limit");
    if (limit_it != params.end()) {
      auto parsed = ParsePositiveInt(limit_it->second);
      if (!parsed) {
        return Reply(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "limit이 올바르지 않습니다"));
      }
      limit = *parsed;
    }
    auto messages = chat_->RecentMessages(game_id, limit, error);
    if (!messages) {
      return ReplyError(res, error);
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope(MessagesToJson(*messages)));
  }

  if (segments.size() == 4 && action == "narrate" && method == http::verb::post) {
    std::string narrate_action;
    if (!req_.body().empty()) {
      auto body = nlohmann::json::parse(req_.body());
      if (body.contains("action") && body["action"].is_string()) {
        narrate_action = body["action"].get<std::string>();
      }
    }
    // 모델 호출은 내레이션 풀에서 돌고 응답은 이 연결의 실행기로 돌아온다.
    auto self = shared_from_this();
    coordinator_->NarrateAsync(
        game_id, narrate_action, [self, res](bool ok, std::optional<std::string> content, OpError narrate_error) {
          boost::asio::post(self->stream_.get_executor(), [self, res, ok, content = std::move(content),
                                                           narrate_error = std::move(narrate_error)]() {
            if (!ok) {
              return self->ReplyError(res, narrate_error);
            }
            nlohmann::json data{{"content", OptionalToJson(content)}};
            self->Reply(res, http::status::ok, MakeSuccessEnvelope(data));
          });
        });
    return;
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    const auto status = static_cast<unsigned>(res->result_int());
    if (status >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{.trace_id = trace_id_,
                                   .game_id = log_game_id_,
                                   .player_id = log_player_id_,
                                   .name = std::string(req_.target()),
                                   .latency_ms = static_cast<long>(latency),
                                   .status = status});
  }
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  auto segments = SplitPath(std::string(req_.target()));
  if (segments.size() != 4 || segments[0] != "ws" || segments[1] != "games") {
    request_start_ = std::chrono::steady_clock::now();
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(http::field::content_type, "application/json; charset=utf-8");
    return Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 WS 경로입니다"));
  }
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(http::field::server, "mystery-coordinator");
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), segments[2], segments[3], coordinator_, observability_,
                                       config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->LogEvent(LogLevel::kWarn, "websocket_accept_failed",
                               {{"gameId", segments[2]}, {"playerId", segments[3]}, {"reason", ex.what()}});
    }
  }
}

}  // namespace mystery
