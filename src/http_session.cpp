/*
 * 설명: HTTP 요청을 처리하고 제출/상태/운영 엔드포인트와 WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/progress_flow_it_test.cpp
 */
#include "progresshub/http_session.hpp"

#include <stdexcept>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "progresshub/workflow_id.hpp"

namespace progresshub {

namespace {
constexpr const char* kServerName = "progress-hub";
constexpr std::string_view kWsPrefix = "/ws/";
constexpr std::string_view kWorkflowPrefix = "/api/workflow/";
constexpr std::string_view kStatusSuffix = "/status";
}  // namespace

std::optional<std::string> ExtractClientId(const std::string& path) {
  if (path.compare(0, kWsPrefix.size(), kWsPrefix) != 0) {
    return std::nullopt;
  }
  auto id = path.substr(kWsPrefix.size());
  if (id.empty() || id.find('/') != std::string::npos) {
    return std::nullopt;
  }
  return id;
}

std::optional<std::string> ExtractWorkflowId(const std::string& path) {
  if (path.size() <= kWorkflowPrefix.size() + kStatusSuffix.size() ||
      path.compare(0, kWorkflowPrefix.size(), kWorkflowPrefix) != 0 ||
      path.compare(path.size() - kStatusSuffix.size(), kStatusSuffix.size(), kStatusSuffix) != 0) {
    return std::nullopt;
  }
  auto id = path.substr(kWorkflowPrefix.size(), path.size() - kWorkflowPrefix.size() - kStatusSuffix.size());
  if (id.empty() || id.find('/') != std::string::npos) {
    return std::nullopt;
  }
  return id;
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const HttpServices> services)
    : stream_(std::move(socket)), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    std::string target(req_.target());
    auto client_id = ExtractClientId(target.substr(0, target.find('?')));
    if (client_id) {
      return HandleWebSocket(*client_id);
    }
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  const auto& observability = services_->observability;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability->NextTraceId();
  observability->IncrementRequest();

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->keep_alive(false);
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  if (req_.method() == http::verb::get && path == "/") {
    return Reply(res, http::status::ok, {{"message", "progress-hub API is running"}});
  }

  if (req_.method() == http::verb::get && path == "/health") {
    return Reply(res, http::status::ok, {{"status", "healthy"}, {"service", kServerName}});
  }

  if (req_.method() == http::verb::get && path == "/api/info") {
    nlohmann::json endpoints{
        {"health", "GET /health - Health check"},
        {"submit_research", "POST /api/research/submit - Submit research query"},
        {"workflow_status", "GET /api/workflow/{workflow_id}/status - Get workflow status"},
        {"websocket_status", "GET /api/websocket/status - Active WebSocket connections"},
        {"agents_status", "GET /api/agents/status - Agent registry status"},
        {"websocket", "WS /ws/{client_id} - Real-time updates"},
        {"api_info", "GET /api/info - This endpoint"}};
    nlohmann::json agents = nlohmann::json::array();
    for (const auto& stage : *services_->research_plan) {
      agents.push_back(stage.name);
    }
    return Reply(res, http::status::ok,
                 {{"service", kServerName},
                  {"version", "1.0.0"},
                  {"description", "Real-time progress notifications for multi-stage research workflows"},
                  {"endpoints", endpoints},
                  {"agents", agents}});
  }

  if (req_.method() == http::verb::get && path == "/api/websocket/status") {
    return Reply(res, http::status::ok,
                 {{"active_connections", services_->registry->Count()}, {"status", "running"}});
  }

  if (req_.method() == http::verb::get && path == "/api/agents/status") {
    nlohmann::json data = nlohmann::json::object();
    for (const auto& status : services_->agents->AllStatuses()) {
      data[status.agent_type] = ToJson(status, services_->config.agent_model_id);
    }
    return Reply(res, http::status::ok, data);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability->Snapshot(services_->workflows->ActiveCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"notifications",
                         {{"broadcasts", snapshot.broadcasts}, {"delivery_failures", snapshot.delivery_failures}}},
                        {"workflows",
                         {{"active", snapshot.workflows_active},
                          {"started", snapshot.workflows_started},
                          {"completed", snapshot.workflows_completed},
                          {"failed", snapshot.workflows_failed}}}};
    return Reply(res, http::status::ok, data);
  }

  if (req_.method() == http::verb::post && path == "/api/research/submit") {
    return HandleSubmit(res);
  }

  if (req_.method() == http::verb::get) {
    if (auto workflow_id = ExtractWorkflowId(path)) {
      return HandleWorkflowStatus(res, *workflow_id);
    }
  }

  ReplyError(res, http::status::not_found, "not_found", "unsupported path");
}

void HttpSession::HandleSubmit(const std::shared_ptr<Response>& res) {
  using boost::beast::http::status;
  auto body_json = nlohmann::json::parse(req_.body(), nullptr, false);
  if (body_json.is_discarded() || !body_json.is_object()) {
    return ReplyError(res, status::unprocessable_entity, "bad_request", "request body must be a JSON object");
  }
  auto query_it = body_json.find("query");
  auto user_it = body_json.find("user_id");
  if (query_it == body_json.end() || !query_it->is_string() || query_it->get<std::string>().empty() ||
      user_it == body_json.end() || !user_it->is_string() || user_it->get<std::string>().empty()) {
    return ReplyError(res, status::unprocessable_entity, "bad_request", "query and user_id are required strings");
  }
  auto priority_it = body_json.find("priority");
  if (priority_it != body_json.end() && !priority_it->is_number_integer()) {
    return ReplyError(res, status::unprocessable_entity, "bad_request", "priority must be an integer");
  }
  auto metadata_it = body_json.find("metadata");
  if (metadata_it != body_json.end() && !metadata_it->is_object() && !metadata_it->is_null()) {
    return ReplyError(res, status::unprocessable_entity, "bad_request", "metadata must be an object");
  }

  WorkflowRequest request;
  request.user_id = user_it->get<std::string>();
  request.input = query_it->get<std::string>();
  request.stages = services_->research_plan;
  try {
    request.workflow_id = GenerateWorkflowId();
  } catch (const std::runtime_error& ex) {
    return ReplyError(res, status::internal_server_error, "id_generation_failed", ex.what());
  }

  std::string error_code;
  std::string error_message;
  if (!services_->workflows->Start(request, error_code, error_message)) {
    auto code = error_code == "workflow_duplicate" ? status::conflict : status::bad_request;
    return ReplyError(res, code, error_code, error_message);
  }
  Reply(res, status::ok,
        {{"workflow_id", request.workflow_id},
         {"status", "initiated"},
         {"message", "Research workflow started for query: " + Abbreviate(request.input, 50)}});
}

void HttpSession::HandleWorkflowStatus(const std::shared_ptr<Response>& res, const std::string& workflow_id) {
  auto snapshot = services_->workflows->Find(workflow_id);
  if (!snapshot) {
    return ReplyError(res, boost::beast::http::status::not_found, "workflow_not_found", "workflow not found");
  }
  nlohmann::json data{{"workflow_id", snapshot->workflow_id},
                      {"status", std::string(WorkflowStatusName(snapshot->status))},
                      {"progress_percentage", snapshot->progress_percentage},
                      {"current_agent", snapshot->current_agent},
                      {"message", snapshot->message},
                      {"user_id", snapshot->user_id}};
  if (!snapshot->error.empty()) {
    data["error"] = snapshot->error;
  }
  Reply(res, boost::beast::http::status::ok, data);
}

void HttpSession::Reply(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                        const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::ReplyError(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                             const std::string& code, const std::string& message) {
  Reply(res, status, {{"error", {{"code", code}, {"message", message}}}});
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  const auto& observability = services_->observability;
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability->Log(LogContext{.trace_id = trace_id_,
                                .name = std::string(req_.target()),
                                .level = LogLevel::kInfo,
                                .detail = std::to_string(res->result_int()),
                                .latency_ms = static_cast<long>(latency)});
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket(const std::string& client_id) {
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  boost::beast::get_lowest_layer(ws).expires_never();
  auto timeouts = boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server);
  timeouts.idle_timeout = boost::beast::websocket::stream_base::none();
  ws.set_option(timeouts);
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    services_->observability->Log(LogContext{.name = "ws.accept_failed",
                                             .level = LogLevel::kWarn,
                                             .client_id = client_id,
                                             .detail = ec.message()});
    boost::beast::get_lowest_layer(ws).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), client_id, services_->registry, services_->command_handler,
                                     services_->observability, services_->config.ws_queue_limit_messages,
                                     services_->config.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace progresshub
