/*
 * 설명: WebSocket 메시지를 읽어 코디네이터로 넘기고, 서버 이벤트를 백프레셔 한도 안에서 전송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "mystery/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "mystery/api_response.hpp"

namespace mystery {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string game_id,
                                   std::string player_id, std::shared_ptr<GameCoordinator> coordinator,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), game_id_(std::move(game_id)), player_id_(std::move(player_id)),
      coordinator_(std::move(coordinator)), observability_(std::move(observability)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { ReleaseSlot(); }

void WebSocketSession::Run() {
  OpError error;
  if (!coordinator_->OnConnect(game_id_, player_id_, shared_from_this(), error)) {
    return RejectAndClose(error);
  }
  registered_ = true;
  DoRead();
}

void WebSocketSession::Deliver(const std::string& frame) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, frame]() { self->EnqueueMessage(frame); });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    // 정상 종료(closed)와 비정상 단절 모두 슬롯을 반납한다.
    ReleaseSlot();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  coordinator_->HandleMessage(game_id_, player_id_, data);

  if (!closing_) {
    DoRead();
  } else {
    ReleaseSlot();
  }
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  if (ec) {
    closing_ = true;
    if (observability_) {
      observability_->IncrementTransportFailure();
    }
    return;
  }
  writing_ = false;
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  if (observability_) {
    observability_->LogEvent(LogLevel::kWarn, "backpressure_exceeded",
                             {{"gameId", game_id_}, {"playerId", player_id_}});
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::RejectAndClose(const OpError& error) {
  closing_ = true;
  auto frame = std::make_shared<std::string>(
      ToWsJson(WsEnvelope{.type = "error", .payload = {{"code", error.code}, {"message", error.message}}}).dump());
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(*frame), [self, frame](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
    reason.reason = "not_found";
    self->ws_.async_close(reason, [self](boost::beast::error_code) {});
  });
}

void WebSocketSession::ReleaseSlot() {
  if (!registered_ || released_) {
    return;
  }
  released_ = true;
  coordinator_->OnDisconnect(game_id_, player_id_, this);
}

}  // namespace mystery
