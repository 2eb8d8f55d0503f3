/*
 * 설명: 서버 전체 수명주기와 공유 서비스(레지스트리, 워크플로 매니저, 에이전트)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/progress_flow_it_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "progresshub/agent_registry.hpp"
#include "progresshub/command_handler.hpp"
#include "progresshub/config.hpp"
#include "progresshub/connection_registry.hpp"
#include "progresshub/http_session.hpp"
#include "progresshub/observability.hpp"
#include "progresshub/workflow_engine.hpp"

namespace progresshub {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  // Run()이 리스너를 연 뒤에만 0이 아니다.
  unsigned short BoundPort() const { return bound_port_.load(); }
  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ConnectionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<WorkflowManager> GetWorkflowManager() { return workflows_; }
  std::shared_ptr<AgentRegistry> GetAgentRegistry() { return agents_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<CommandHandler> command_handler_;
  std::shared_ptr<AgentRegistry> agents_;
  std::shared_ptr<WorkflowManager> workflows_;
  std::shared_ptr<const HttpServices> services_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<unsigned short> bound_port_{0};
};

}  // namespace progresshub
