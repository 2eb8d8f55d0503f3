/*
 * 설명: HTTP 연결을 처리하고 워크플로 제출/상태 조회 엔드포인트와 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/progress_flow_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include "progresshub/agent_registry.hpp"
#include "progresshub/command_handler.hpp"
#include "progresshub/config.hpp"
#include "progresshub/connection_registry.hpp"
#include "progresshub/observability.hpp"
#include "progresshub/stage.hpp"
#include "progresshub/websocket_session.hpp"
#include "progresshub/workflow_engine.hpp"

namespace progresshub {

struct HttpServices {
  AppConfig config;
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<CommandHandler> command_handler;
  std::shared_ptr<WorkflowManager> workflows;
  std::shared_ptr<AgentRegistry> agents;
  std::shared_ptr<Observability> observability;
  SharedStagePlan research_plan;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const HttpServices> services);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleSubmit(const std::shared_ptr<Response>& res);
  void HandleWorkflowStatus(const std::shared_ptr<Response>& res, const std::string& workflow_id);
  void Reply(const std::shared_ptr<Response>& res, boost::beast::http::status status, const nlohmann::json& body);
  void ReplyError(const std::shared_ptr<Response>& res, boost::beast::http::status status, const std::string& code,
                  const std::string& message);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket(const std::string& client_id);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const HttpServices> services_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

// "/ws/{client_id}" 형태에서 client_id를 꺼낸다.
std::optional<std::string> ExtractClientId(const std::string& path);
// "/api/workflow/{id}/status" 형태에서 id를 꺼낸다.
std::optional<std::string> ExtractWorkflowId(const std::string& path);

}  // namespace progresshub
