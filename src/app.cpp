/*
 * 설명: 서버 수명주기와 리스닝/워커 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/progress_flow_it_test.cpp
 */
#include "progresshub/app.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "progresshub/research_pipeline.hpp"

namespace progresshub {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const HttpServices> services)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), services_(std::move(services)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short LocalPort() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->services_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const HttpServices> services_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  registry_ = std::make_shared<ConnectionRegistry>();
  registry_->SetObservability(observability_);
  command_handler_ = std::make_shared<CommandHandler>(registry_, observability_);
  agents_ = std::make_shared<AgentRegistry>();
  RegisterResearchAgents(*agents_);
  workflows_ = std::make_shared<WorkflowManager>(ioc_, registry_, agents_, observability_,
                                                 config.job_retention_limit);
  services_ = std::make_shared<const HttpServices>(HttpServices{config_, registry_, command_handler_, workflows_,
                                                                agents_, observability_,
                                                                DefaultResearchPipeline(config.stage_time_scale_percent)});
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, services_);
    listener_->Run();
    bound_port_ = listener_->LocalPort();
    signals_.async_wait([this](const boost::system::error_code& ec, int /*signal*/) {
      if (!ec) {
        ioc_.stop();
      }
    });
    observability_->Log(LogContext{.name = "server.started",
                                   .level = LogLevel::kInfo,
                                   .detail = "port " + std::to_string(bound_port_.load())});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{.name = "server.failed", .level = LogLevel::kError, .detail = ex.what()});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count =
      config_.worker_threads > 0 ? static_cast<unsigned int>(config_.worker_threads)
                                 : std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  boost::system::error_code ec;
  signals_.cancel(ec);
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
  workers_.clear();
}

std::size_t ParseBoundedCount(const std::string& key, const std::string& value, std::size_t max_value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument(key + " must be a non-negative integer: " + value);
  }
  const auto parsed = std::stoull(value);
  if (parsed > max_value) {
    throw std::out_of_range(key + " must be at most " + std::to_string(max_value) + ": " + value);
  }
  return static_cast<std::size_t>(parsed);
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_count = [&get_env](const char* key, const char* def, std::size_t max_value) {
    return ParseBoundedCount(key, get_env(key, def), max_value);
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(get_count("SERVER_PORT", "8000", kMaxPort));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = get_count("WS_QUEUE_LIMIT_MESSAGES", "64", kMaxQueueMessages);
  cfg.ws_queue_limit_bytes = get_count("WS_QUEUE_LIMIT_BYTES", "1048576", kMaxQueueBytes);
  cfg.worker_threads = get_count("WORKER_THREADS", "0", kMaxWorkerThreads);
  cfg.stage_time_scale_percent = get_count("STAGE_TIME_SCALE_PERCENT", "100", kMaxStageTimeScalePercent);
  cfg.job_retention_limit = get_count("JOB_RETENTION_LIMIT", "256", kMaxJobRetention);
  cfg.agent_model_id = get_env("AGENT_MODEL_ID", "simulated");
  return cfg;
}

}  // namespace progresshub
