/*
 * 설명: 워크플로 단계 서술자와 단계 작업자(에이전트) 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/workflow_engine_test.cpp
 */
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace progresshub {

struct StageDescriptor {
  std::string name;
  std::string agent_type;
  std::chrono::milliseconds duration;
  std::string message;
};

using StagePlan = std::vector<StageDescriptor>;
using SharedStagePlan = std::shared_ptr<const StagePlan>;

struct StageInput {
  std::string workflow_id;
  std::string user_id;
  std::string input;
  std::map<std::string, std::string> previous_outputs;
};

struct StageOutcome {
  bool ok{false};
  std::string output;
  std::string error;

  static StageOutcome Success(std::string output) { return StageOutcome{true, std::move(output), {}}; }
  static StageOutcome Failure(std::string error) { return StageOutcome{false, {}, std::move(error)}; }
};

class StageWorker {
 public:
  virtual ~StageWorker() = default;
  virtual StageOutcome Run(const StageInput& input) = 0;
};

}  // namespace progresshub
