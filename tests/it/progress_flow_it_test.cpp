#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "progresshub/app.hpp"

namespace {

progresshub::AppConfig TestConfig() {
  progresshub::AppConfig cfg{};
  cfg.port = 0;
  cfg.log_level = "error";
  cfg.ws_queue_limit_messages = 64;
  cfg.ws_queue_limit_bytes = 1 << 20;
  cfg.worker_threads = 2;
  cfg.stage_time_scale_percent = 1;
  cfg.job_retention_limit = 32;
  cfg.agent_model_id = "it-model";
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

class ProgressFlowFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    app_ = std::make_unique<progresshub::ServerApp>(TestConfig());
    server_thread_ = std::thread([this]() { app_->Run(); });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (app_->BoundPort() == 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    port_ = app_->BoundPort();
    ASSERT_NE(port_, 0);
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  SimpleHttpResponse Request(boost::beast::http::verb verb, const std::string& target, const std::string& body = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port_)));

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!body.empty()) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body;
      req.prepare_payload();
    }
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body(), nullptr, false)};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse Get(const std::string& target) { return Request(boost::beast::http::verb::get, target); }

  SimpleHttpResponse Post(const std::string& target, const nlohmann::json& body) {
    return Request(boost::beast::http::verb::post, target, body.dump());
  }

  std::unique_ptr<progresshub::ServerApp> app_;
  std::thread server_thread_;
  unsigned short port_{0};
};

class WsClient {
 public:
  WsClient(unsigned short port, const std::string& client_id) : ws_(ioc_) {
    boost::asio::ip::tcp::resolver resolver{ioc_};
    auto results = resolver.resolve("127.0.0.1", std::to_string(port));
    boost::asio::connect(ws_.next_layer(), results.begin(), results.end());
    ws_.handshake("127.0.0.1:" + std::to_string(port), "/ws/" + client_id);
  }

  ~WsClient() {
    boost::beast::error_code ec;
    ws_.close(boost::beast::websocket::close_code::normal, ec);
  }

  std::string ReadText() {
    boost::beast::flat_buffer buffer;
    ws_.read(buffer);
    return boost::beast::buffers_to_string(buffer.data());
  }

  nlohmann::json ReadJson() { return nlohmann::json::parse(ReadText(), nullptr, false); }

  void Write(const std::string& text) {
    ws_.text(true);
    ws_.write(boost::asio::buffer(text));
  }

 private:
  boost::asio::io_context ioc_;
  boost::beast::websocket::stream<boost::asio::ip::tcp::socket> ws_;
};

}  // namespace

TEST_F(ProgressFlowFixture, HealthAndInfo) {
  auto health = Get("/health");
  ASSERT_EQ(health.status, boost::beast::http::status::ok);
  EXPECT_EQ(health.body["status"], "healthy");

  auto info = Get("/api/info");
  ASSERT_EQ(info.status, boost::beast::http::status::ok);
  ASSERT_TRUE(info.body["agents"].is_array());
  EXPECT_EQ(info.body["agents"].size(), 5u);
  EXPECT_TRUE(info.body["endpoints"].is_object());

  auto missing = Get("/nowhere");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  EXPECT_EQ(missing.body["error"]["code"], "not_found");
}

TEST_F(ProgressFlowFixture, ConnectPingAndEcho) {
  WsClient client(port_, "c1");
  auto connection = client.ReadJson();
  EXPECT_EQ(connection["type"], "connection");
  EXPECT_EQ(connection["client_id"], "c1");

  client.Write(R"({"type":"ping"})");
  EXPECT_EQ(client.ReadJson()["type"], "pong");

  client.Write("not json at all");
  EXPECT_EQ(client.ReadText(), "Received: not json at all");

  client.Write(R"({"type":"subscribe","workflow_id":"job_42"})");
  auto confirmed = client.ReadJson();
  EXPECT_EQ(confirmed["type"], "subscription_confirmed");
  EXPECT_EQ(confirmed["workflow_id"], "job_42");

  auto status = Get("/api/websocket/status");
  ASSERT_EQ(status.status, boost::beast::http::status::ok);
  EXPECT_EQ(status.body["active_connections"], 1);
}

TEST_F(ProgressFlowFixture, SubmittedWorkflowStreamsProgress) {
  WsClient client(port_, "watcher");
  ASSERT_EQ(client.ReadJson()["type"], "connection");

  auto submit = Post("/api/research/submit", {{"query", "quantum dots"}, {"user_id", "u1"}, {"priority", 1}});
  ASSERT_EQ(submit.status, boost::beast::http::status::ok);
  EXPECT_EQ(submit.body["status"], "initiated");
  const auto workflow_id = submit.body["workflow_id"].get<std::string>();
  EXPECT_EQ(workflow_id.rfind("workflow_", 0), 0u);

  std::vector<nlohmann::json> events;
  for (int i = 0; i < 20; ++i) {
    auto event = client.ReadJson();
    events.push_back(event);
    if (event["type"] == "workflow_completed" || event["type"] == "workflow_failed") {
      break;
    }
  }
  ASSERT_EQ(events.size(), 11u);
  EXPECT_EQ(events.back()["type"], "workflow_completed");
  EXPECT_EQ(events.back()["workflow_id"], workflow_id);
  EXPECT_EQ(events.back()["results"]["stages_completed"], 5);

  const char* stages[] = {"Research", "Data", "Experiment", "Critic", "Visualization"};
  double previous = -1.0;
  for (std::size_t i = 0; i < 10; ++i) {
    const auto& event = events[i];
    EXPECT_EQ(event["type"], "agent_status");
    EXPECT_EQ(event["workflow_id"], workflow_id);
    EXPECT_EQ(event["agent_name"], stages[i / 2]);
    EXPECT_EQ(event["status"], i % 2 == 0 ? "processing" : "completed");
    auto progress = event["progress_percentage"].get<double>();
    EXPECT_GE(progress, previous);
    previous = progress;
  }
  EXPECT_DOUBLE_EQ(events[9]["progress_percentage"].get<double>(), 100.0);

  auto status = Get("/api/workflow/" + workflow_id + "/status");
  ASSERT_EQ(status.status, boost::beast::http::status::ok);
  EXPECT_EQ(status.body["status"], "completed");
  EXPECT_DOUBLE_EQ(status.body["progress_percentage"].get<double>(), 100.0);
  EXPECT_EQ(status.body["user_id"], "u1");

  auto agents = Get("/api/agents/status");
  ASSERT_EQ(agents.status, boost::beast::http::status::ok);
  EXPECT_EQ(agents.body["research"]["status"], "ready");
  EXPECT_EQ(agents.body["research"]["model_id"], "it-model");

  auto metrics = Get("/metrics");
  ASSERT_EQ(metrics.status, boost::beast::http::status::ok);
  EXPECT_EQ(metrics.body["workflows"]["completed"], 1);
}

TEST_F(ProgressFlowFixture, SubmitValidationAndUnknownWorkflow) {
  auto missing_query = Post("/api/research/submit", {{"user_id", "u1"}});
  EXPECT_EQ(missing_query.status, boost::beast::http::status::unprocessable_entity);
  EXPECT_EQ(missing_query.body["error"]["code"], "bad_request");

  auto bad_priority = Post("/api/research/submit", {{"query", "q"}, {"user_id", "u1"}, {"priority", "high"}});
  EXPECT_EQ(bad_priority.status, boost::beast::http::status::unprocessable_entity);

  auto unknown = Get("/api/workflow/workflow_missing/status");
  EXPECT_EQ(unknown.status, boost::beast::http::status::not_found);
  EXPECT_EQ(unknown.body["error"]["code"], "workflow_not_found");
}

TEST_F(ProgressFlowFixture, ReconnectReplacesPreviousSocket) {
  WsClient first(port_, "dup");
  ASSERT_EQ(first.ReadJson()["type"], "connection");
  WsClient second(port_, "dup");
  ASSERT_EQ(second.ReadJson()["type"], "connection");

  second.Write(R"({"type":"ping"})");
  EXPECT_EQ(second.ReadJson()["type"], "pong");

  auto status = Get("/api/websocket/status");
  EXPECT_EQ(status.body["active_connections"], 1);
}
