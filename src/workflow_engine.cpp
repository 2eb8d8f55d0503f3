/*
 * 설명: 워크플로 생성, 단계 타이머 루프, 작업자 호출, 완료/실패 알림을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/workflow_engine_test.cpp, tests/it/progress_flow_it_test.cpp
 */
#include "progresshub/workflow_engine.hpp"

#include <exception>
#include <sstream>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>

#include "progresshub/envelope.hpp"

namespace progresshub {

std::string_view WorkflowStatusName(WorkflowStatus status) {
  switch (status) {
    case WorkflowStatus::kPending:
      return "pending";
    case WorkflowStatus::kRunning:
      return "running";
    case WorkflowStatus::kCompleted:
      return "completed";
    case WorkflowStatus::kFailed:
      return "failed";
  }
  return "pending";
}

std::string Abbreviate(const std::string& text, std::size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  return text.substr(0, limit) + "...";
}

double StageProgress(std::size_t completed, std::size_t total) {
  if (total == 0) {
    return 100.0;
  }
  return static_cast<double>(completed) * 100.0 / static_cast<double>(total);
}

WorkflowManager::WorkflowManager(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                                 std::shared_ptr<AgentRegistry> agents, std::shared_ptr<Observability> observability,
                                 std::size_t retention_limit)
    : ioc_(ioc), registry_(std::move(registry)), agents_(std::move(agents)),
      observability_(std::move(observability)), retention_limit_(retention_limit) {}

bool WorkflowManager::Start(const WorkflowRequest& request, std::string& error_code, std::string& error_message) {
  if (request.workflow_id.empty() || request.user_id.empty()) {
    error_code = "bad_request";
    error_message = "workflow_id and user_id are required";
    return false;
  }
  if (!request.stages || request.stages->empty()) {
    error_code = "empty_pipeline";
    error_message = "a workflow needs at least one stage";
    return false;
  }

  auto ctx = std::make_shared<WorkflowContext>(ioc_);
  ctx->id = request.workflow_id;
  ctx->user_id = request.user_id;
  ctx->input = request.input;
  ctx->stages = request.stages;
  ctx->message = "Workflow queued";
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (workflows_.count(ctx->id) > 0) {
      error_code = "workflow_duplicate";
      error_message = "workflow already exists";
      return false;
    }
    workflows_[ctx->id] = ctx;
  }
  if (observability_) {
    observability_->IncrementWorkflowStarted();
    observability_->Log(LogContext{.name = "workflow.started",
                                   .level = LogLevel::kInfo,
                                   .workflow_id = ctx->id,
                                   .user_id = ctx->user_id,
                                   .detail = std::to_string(ctx->stages->size()) + " stage(s)"});
  }

  boost::asio::dispatch(ctx->strand, [self = shared_from_this(), ctx]() {
    ctx->started_at = std::chrono::steady_clock::now();
    self->BeginStage(ctx);
  });
  return true;
}

std::optional<WorkflowSnapshot> WorkflowManager::Find(const std::string& workflow_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = workflows_.find(workflow_id);
  if (it == workflows_.end()) {
    return std::nullopt;
  }
  return SnapshotLocked(*it->second);
}

std::size_t WorkflowManager::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t active = 0;
  for (const auto& [id, ctx] : workflows_) {
    if (ctx->status == WorkflowStatus::kPending || ctx->status == WorkflowStatus::kRunning) {
      ++active;
    }
  }
  return active;
}

std::size_t WorkflowManager::TotalCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return workflows_.size();
}

void WorkflowManager::BeginStage(const std::shared_ptr<WorkflowContext>& ctx) {
  const auto& stages = *ctx->stages;
  const std::size_t index = ctx->next_stage;
  if (index >= stages.size()) {
    CompleteWorkflow(ctx);
    return;
  }
  const auto& stage = stages[index];
  UpdateState(ctx, WorkflowStatus::kRunning, index, stage.message);

  registry_->Broadcast(MakeAgentStatusEnvelope(AgentStatusUpdate{ctx->id,
                                                                 ctx->user_id,
                                                                 stage.name,
                                                                 "processing",
                                                                 stage.message,
                                                                 StageProgress(index, stages.size()),
                                                                 {}}));

  ctx->timer.expires_after(stage.duration);
  auto self = shared_from_this();
  ctx->timer.async_wait(boost::asio::bind_executor(
      ctx->strand, [self, ctx](const boost::system::error_code& ec) { self->OnStageTimer(ctx, ec); }));
}

void WorkflowManager::OnStageTimer(const std::shared_ptr<WorkflowContext>& ctx, const boost::system::error_code& ec) {
  const auto& stages = *ctx->stages;
  const std::size_t index = ctx->next_stage;
  const auto& stage = stages[index];
  if (ec) {
    FailWorkflow(ctx, stage, "stage wait interrupted: " + ec.message());
    return;
  }

  auto outcome = RunStageWorker(ctx, stage);
  if (!outcome.ok) {
    FailWorkflow(ctx, stage, outcome.error);
    return;
  }
  ctx->outputs[stage.name] = outcome.output;
  ctx->next_stage = index + 1;

  registry_->Broadcast(MakeAgentStatusEnvelope(AgentStatusUpdate{ctx->id,
                                                                 ctx->user_id,
                                                                 stage.name,
                                                                 "completed",
                                                                 stage.name + " stage completed",
                                                                 StageProgress(index + 1, stages.size()),
                                                                 outcome.output}));
  BeginStage(ctx);
}

StageOutcome WorkflowManager::RunStageWorker(const std::shared_ptr<WorkflowContext>& ctx,
                                             const StageDescriptor& stage) {
  auto worker = agents_->GetOrCreate(stage.agent_type);
  if (!worker) {
    return StageOutcome::Failure("agent_unavailable: " + stage.agent_type);
  }
  StageInput input{ctx->id, ctx->user_id, ctx->input, ctx->outputs};
  try {
    return worker->Run(input);
  } catch (const std::exception& ex) {
    return StageOutcome::Failure(ex.what());
  }
}

void WorkflowManager::CompleteWorkflow(const std::shared_ptr<WorkflowContext>& ctx) {
  const auto& stages = *ctx->stages;
  std::chrono::milliseconds total{0};
  for (const auto& stage : stages) {
    total += stage.duration;
  }
  std::ostringstream summary;
  summary << "Workflow completed: " << stages.size() << " stage(s) processed for \"" << Abbreviate(ctx->input, 50)
          << "\"";
  UpdateState(ctx, WorkflowStatus::kCompleted, stages.size(), summary.str());

  nlohmann::json outputs = nlohmann::json::object();
  for (const auto& [name, output] : ctx->outputs) {
    outputs[name] = output;
  }
  registry_->Broadcast(MakeWorkflowCompletedEnvelope(
      WorkflowSummary{ctx->id, ctx->user_id, stages.size(), total.count(), summary.str(), outputs}));

  if (observability_) {
    observability_->IncrementWorkflowCompleted();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                         ctx->started_at)
                       .count();
    observability_->Log(LogContext{.name = "workflow.completed",
                                   .level = LogLevel::kInfo,
                                   .workflow_id = ctx->id,
                                   .user_id = ctx->user_id,
                                   .latency_ms = static_cast<long>(elapsed)});
  }
  Retire(ctx->id);
}

void WorkflowManager::FailWorkflow(const std::shared_ptr<WorkflowContext>& ctx, const StageDescriptor& stage,
                                   const std::string& error) {
  const std::size_t index = ctx->next_stage;
  UpdateState(ctx, WorkflowStatus::kFailed, index, stage.name + " failed", error);
  registry_->Broadcast(MakeWorkflowFailedEnvelope(
      WorkflowFailure{ctx->id, ctx->user_id, stage.name, error, StageProgress(index, ctx->stages->size())}));

  if (observability_) {
    observability_->IncrementWorkflowFailed();
    observability_->Log(LogContext{.name = "workflow.failed",
                                   .level = LogLevel::kWarn,
                                   .workflow_id = ctx->id,
                                   .user_id = ctx->user_id,
                                   .detail = stage.name + ": " + error});
  }
  Retire(ctx->id);
}

void WorkflowManager::UpdateState(const std::shared_ptr<WorkflowContext>& ctx, WorkflowStatus status,
                                  std::size_t stage_index, const std::string& message, const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  ctx->status = status;
  ctx->stage_index = stage_index;
  ctx->message = message;
  ctx->error = error;
}

void WorkflowManager::Retire(const std::string& workflow_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  retired_.push_back(workflow_id);
  while (retired_.size() > retention_limit_) {
    workflows_.erase(retired_.front());
    retired_.pop_front();
  }
}

WorkflowSnapshot WorkflowManager::SnapshotLocked(const WorkflowContext& ctx) const {
  const auto& stages = *ctx.stages;
  WorkflowSnapshot snapshot;
  snapshot.workflow_id = ctx.id;
  snapshot.user_id = ctx.user_id;
  snapshot.status = ctx.status;
  snapshot.stage_count = stages.size();
  snapshot.current_stage = ctx.stage_index;
  snapshot.message = ctx.message;
  snapshot.error = ctx.error;
  switch (ctx.status) {
    case WorkflowStatus::kPending:
      snapshot.progress_percentage = 0.0;
      break;
    case WorkflowStatus::kRunning:
    case WorkflowStatus::kFailed:
      snapshot.progress_percentage = StageProgress(ctx.stage_index, stages.size());
      break;
    case WorkflowStatus::kCompleted:
      snapshot.progress_percentage = 100.0;
      break;
  }
  if (ctx.stage_index < stages.size()) {
    snapshot.current_agent = stages[ctx.stage_index].agent_type;
  }
  return snapshot;
}

}  // namespace progresshub
