/*
 * 설명: WebSocket 연결을 클라이언트 채널로 노출하고 수신 메시지를 명령 처리기로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/progress_flow_it_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "progresshub/client_channel.hpp"
#include "progresshub/command_handler.hpp"
#include "progresshub/connection_registry.hpp"
#include "progresshub/observability.hpp"

namespace progresshub {

class WebSocketSession : public ClientChannel, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string client_id,
                   std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<CommandHandler> handler,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  void Run();

  bool Send(std::string message) override;
  void Close() override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void DoClose(boost::beast::websocket::close_code code, const char* reason);
  void StartClose();
  void MarkBroken(const char* reason);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string client_id_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<CommandHandler> handler_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::atomic<std::size_t> pending_messages_{0};
  std::atomic<std::size_t> pending_bytes_{0};
  std::atomic<bool> closing_{false};
  bool writing_{false};
  bool closed_notified_{false};
  bool close_requested_{false};
  bool close_started_{false};
  boost::beast::websocket::close_reason close_reason_;
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace progresshub
