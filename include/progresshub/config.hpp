/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/it/progress_flow_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace progresshub {

struct AppConfig {
  unsigned short port{8000};
  std::string log_level{"info"};
  std::size_t ws_queue_limit_messages{64};
  std::size_t ws_queue_limit_bytes{1 << 20};
  std::size_t worker_threads{0};
  std::size_t stage_time_scale_percent{100};
  std::size_t job_retention_limit{256};
  std::string agent_model_id{"simulated"};
};

inline constexpr std::size_t kMaxPort = 65535;
inline constexpr std::size_t kMaxQueueMessages = 100000;
inline constexpr std::size_t kMaxQueueBytes = std::size_t{1} << 30;
inline constexpr std::size_t kMaxWorkerThreads = 256;
inline constexpr std::size_t kMaxStageTimeScalePercent = 100000;
inline constexpr std::size_t kMaxJobRetention = 1000000;

// 숫자만 허용하고 max_value를 넘으면 std::out_of_range, 형식이 틀리면 std::invalid_argument.
std::size_t ParseBoundedCount(const std::string& key, const std::string& value, std::size_t max_value);

// 잘못된 값이 있으면 ParseBoundedCount의 예외를 그대로 전달한다.
AppConfig LoadConfigFromEnv();

}  // namespace progresshub
