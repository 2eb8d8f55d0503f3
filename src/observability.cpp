/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "progresshub/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace progresshub {

namespace {
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::IncrementBroadcast() { broadcasts_.fetch_add(1); }

void Observability::IncrementDeliveryFailure() { delivery_failures_.fetch_add(1); }

void Observability::IncrementWorkflowStarted() { workflows_started_.fetch_add(1); }

void Observability::IncrementWorkflowCompleted() { workflows_completed_.fetch_add(1); }

void Observability::IncrementWorkflowFailed() { workflows_failed_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_workflows) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.broadcasts = broadcasts_.load();
  snapshot.delivery_failures = delivery_failures_.load();
  snapshot.workflows_started = workflows_started_.load();
  snapshot.workflows_completed = workflows_completed_.load();
  snapshot.workflows_failed = workflows_failed_.load();
  snapshot.workflows_active = active_workflows;
  return snapshot;
}

nlohmann::json Observability::FormatLine(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["level"] = std::string(LogLevelName(ctx.level));
  log_json["eventName"] = ctx.name;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (ctx.latency_ms > 0) {
    log_json["latencyMs"] = ctx.latency_ms;
  }
  if (ctx.client_id) {
    log_json["clientId"] = *ctx.client_id;
  }
  if (ctx.workflow_id) {
    log_json["workflowId"] = *ctx.workflow_id;
  }
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  return log_json;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  auto line = FormatLine(ctx).dump();
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << line << std::endl;
}

}  // namespace progresshub
