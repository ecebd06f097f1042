/*
 * 설명: 게임 세션 WebSocket 연결의 메시지 수신, 송신 큐 백프레셔, 접속/해제 통지를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "mystery/game_coordinator.hpp"
#include "mystery/observability.hpp"
#include "mystery/realtime.hpp"

namespace mystery {

class WebSocketSession : public ConnectionHandle, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string game_id,
                   std::string player_id, std::shared_ptr<GameCoordinator> coordinator,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 임의 스레드에서 호출된다. 연결 strand로 넘겨 큐에 넣는다.
  void Deliver(const std::string& frame) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void RejectAndClose(const OpError& error);
  void ReleaseSlot();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string game_id_;
  std::string player_id_;
  std::shared_ptr<GameCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool registered_{false};
  bool released_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace mystery
