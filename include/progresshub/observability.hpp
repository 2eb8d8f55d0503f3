/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace progresshub {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  std::optional<std::string> client_id;
  std::optional<std::string> workflow_id;
  std::optional<std::string> user_id;
  std::optional<std::string> detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t broadcasts{0};
  std::uint64_t delivery_failures{0};
  std::uint64_t workflows_started{0};
  std::uint64_t workflows_completed{0};
  std::uint64_t workflows_failed{0};
  std::uint64_t workflows_active{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void IncrementBroadcast();
  void IncrementDeliveryFailure();
  void IncrementWorkflowStarted();
  void IncrementWorkflowCompleted();
  void IncrementWorkflowFailed();
  MetricsSnapshot Snapshot(std::uint64_t active_workflows) const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  nlohmann::json FormatLine(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> broadcasts_{0};
  std::atomic<std::uint64_t> delivery_failures_{0};
  std::atomic<std::uint64_t> workflows_started_{0};
  std::atomic<std::uint64_t> workflows_completed_{0};
  std::atomic<std::uint64_t> workflows_failed_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace progresshub
