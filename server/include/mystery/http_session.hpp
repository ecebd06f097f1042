/*
 * 설명: HTTP 연결을 처리하고 게임 로비/진행 REST 엔드포인트와 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "mystery/chat_service.hpp"
#include "mystery/clue_protocol.hpp"
#include "mystery/config.hpp"
#include "mystery/errors.hpp"
#include "mystery/game_coordinator.hpp"
#include "mystery/game_service.hpp"
#include "mystery/observability.hpp"
#include "mystery/phase_machine.hpp"
#include "mystery/realtime.hpp"

namespace mystery {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<GameService> game_service,
              std::shared_ptr<PhaseStateMachine> phases,
              std::shared_ptr<ClueProtocol> clues,
              std::shared_ptr<ChatService> chat,
              std::shared_ptr<GameCoordinator> coordinator,
              std::shared_ptr<ConnectionRegistry> registry,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void RouteGame(const std::shared_ptr<Response>& res, const std::vector<std::string>& segments,
                 const std::string& query);
  void Reply(const std::shared_ptr<Response>& res, boost::beast::http::status status, const nlohmann::json& body);
  void ReplyError(const std::shared_ptr<Response>& res, const OpError& error);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<GameService> game_service_;
  std::shared_ptr<PhaseStateMachine> phases_;
  std::shared_ptr<ClueProtocol> clues_;
  std::shared_ptr<ChatService> chat_;
  std::shared_ptr<GameCoordinator> coordinator_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> log_game_id_;
  std::optional<std::string> log_player_id_;
};

// "/a/b/c" → {"a", "b", "c"}
std::vector<std::string> SplitPath(const std::string& path);

}  // namespace mystery
