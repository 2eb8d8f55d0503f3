/*
 * 설명: 워크플로별 단계 진행 상태기계를 구동하고 진행 알림을 브로드캐스트한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/workflow_engine_test.cpp, tests/it/progress_flow_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "progresshub/agent_registry.hpp"
#include "progresshub/connection_registry.hpp"
#include "progresshub/observability.hpp"
#include "progresshub/stage.hpp"

namespace progresshub {

enum class WorkflowStatus { kPending, kRunning, kCompleted, kFailed };

std::string_view WorkflowStatusName(WorkflowStatus status);

struct WorkflowRequest {
  std::string workflow_id;
  std::string user_id;
  std::string input;
  SharedStagePlan stages;
};

struct WorkflowSnapshot {
  std::string workflow_id;
  std::string user_id;
  WorkflowStatus status{WorkflowStatus::kPending};
  double progress_percentage{0.0};
  std::size_t current_stage{0};
  std::size_t stage_count{0};
  std::string current_agent;
  std::string message;
  std::string error;
};

class WorkflowManager : public std::enable_shared_from_this<WorkflowManager> {
 public:
  WorkflowManager(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                  std::shared_ptr<AgentRegistry> agents, std::shared_ptr<Observability> observability,
                  std::size_t retention_limit);

  bool Start(const WorkflowRequest& request, std::string& error_code, std::string& error_message);
  std::optional<WorkflowSnapshot> Find(const std::string& workflow_id) const;
  std::size_t ActiveCount() const;
  std::size_t TotalCount() const;

 private:
  struct WorkflowContext {
    std::string id;
    std::string user_id;
    std::string input;
    SharedStagePlan stages;
    std::map<std::string, std::string> outputs;
    std::size_t next_stage{0};
    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    boost::asio::steady_timer timer;
    std::chrono::steady_clock::time_point started_at;

    // 아래 필드는 매니저 mutex_ 하에서 갱신/조회한다.
    WorkflowStatus status{WorkflowStatus::kPending};
    std::size_t stage_index{0};
    std::string message;
    std::string error;

    explicit WorkflowContext(boost::asio::io_context& ioc)
        : strand(boost::asio::make_strand(ioc)), timer(ioc) {}
  };

  void BeginStage(const std::shared_ptr<WorkflowContext>& ctx);
  void OnStageTimer(const std::shared_ptr<WorkflowContext>& ctx, const boost::system::error_code& ec);
  StageOutcome RunStageWorker(const std::shared_ptr<WorkflowContext>& ctx, const StageDescriptor& stage);
  void CompleteWorkflow(const std::shared_ptr<WorkflowContext>& ctx);
  void FailWorkflow(const std::shared_ptr<WorkflowContext>& ctx, const StageDescriptor& stage,
                    const std::string& error);
  void UpdateState(const std::shared_ptr<WorkflowContext>& ctx, WorkflowStatus status, std::size_t stage_index,
                   const std::string& message, const std::string& error = {});
  void Retire(const std::string& workflow_id);
  WorkflowSnapshot SnapshotLocked(const WorkflowContext& ctx) const;

  boost::asio::io_context& ioc_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<AgentRegistry> agents_;
  std::shared_ptr<Observability> observability_;
  std::size_t retention_limit_;
  std::unordered_map<std::string, std::shared_ptr<WorkflowContext>> workflows_;
  std::deque<std::string> retired_;
  mutable std::mutex mutex_;
};

double StageProgress(std::size_t completed, std::size_t total);

// limit자를 넘으면 잘라서 "..."을 붙인다.
std::string Abbreviate(const std::string& text, std::size_t limit);

}  // namespace progresshub
