/*
 * 설명: WebSocket 메시지를 읽어 명령 처리기로 넘기고, 스트랜드 위에서 순서대로 전송하며 백프레셔를 감시한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/progress_flow_it_test.cpp
 */
#include "progresshub/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace progresshub {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::string client_id, std::shared_ptr<ConnectionRegistry> registry,
                                   std::shared_ptr<CommandHandler> handler,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), client_id_(std::move(client_id)), registry_(std::move(registry)),
      handler_(std::move(handler)), observability_(std::move(observability)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

void WebSocketSession::Run() {
  registry_->Connect(client_id_, shared_from_this());
  DoRead();
}

bool WebSocketSession::Send(std::string message) {
  if (closing_.load()) {
    return false;
  }
  const auto message_size = message.size();
  const auto queued = pending_messages_.fetch_add(1) + 1;
  const auto bytes = pending_bytes_.fetch_add(message_size) + message_size;
  if (queued > max_queue_messages_ || bytes > max_queue_bytes_) {
    pending_messages_.fetch_sub(1);
    pending_bytes_.fetch_sub(message_size);
    if (!closing_.exchange(true)) {
      boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() {
        self->DoClose(boost::beast::websocket::close_code::policy_error, "backpressure_exceeded");
      });
    }
    return false;
  }
  // 같은 스트랜드로 post하므로 한 클라이언트에 대한 전송 순서가 유지된다.
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
  return true;
}

void WebSocketSession::Close() {
  if (closing_.exchange(true)) {
    return;
  }
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() {
    self->DoClose(boost::beast::websocket::close_code::normal, "replaced");
  });
}

void WebSocketSession::DoRead() {
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    MarkBroken(ec == boost::beast::websocket::error::closed ? "closed" : "read_error");
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (!closing_.load()) {
    handler_->HandleMessage(client_id_, data);
  }
  DoRead();
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_.load()) {
    pending_messages_.fetch_sub(1);
    pending_bytes_.fetch_sub(message.size());
    return;
  }
  send_queue_.push_back(std::move(message));
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_.load()) {
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
    pending_messages_.fetch_sub(1);
    pending_bytes_.fetch_sub(send_queue_.front().size());
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_.store(true);
    MarkBroken("write_error");
    return;
  }
  if (close_requested_) {
    StartClose();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::DoClose(boost::beast::websocket::close_code code, const char* reason) {
  if (close_requested_ || close_started_) {
    return;
  }
  close_requested_ = true;
  close_reason_ = boost::beast::websocket::close_reason{code};
  close_reason_.reason = reason;
  if (code != boost::beast::websocket::close_code::normal) {
    MarkBroken(reason);
  }
  // 진행 중인 쓰기가 있으면 OnWrite에서 이어서 닫는다.
  if (!writing_) {
    StartClose();
  }
}

void WebSocketSession::StartClose() {
  close_requested_ = false;
  close_started_ = true;
  send_queue_.clear();
  auto self = shared_from_this();
  ws_.async_close(close_reason_, [self](boost::beast::error_code) {});
}

void WebSocketSession::MarkBroken(const char* reason) {
  if (closed_notified_) {
    return;
  }
  closed_notified_ = true;
  closing_.store(true);
  handler_->HandleClosed(client_id_, this);
  if (observability_) {
    observability_->Log(LogContext{.name = "ws.closed",
                                   .level = LogLevel::kDebug,
                                   .client_id = client_id_,
                                   .detail = std::string(reason)});
  }
}

}  // namespace progresshub
