/*
 * 설명: 기본 연구 워크플로의 단계 구성과 모의 에이전트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/agent_registry_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "progresshub/agent_registry.hpp"
#include "progresshub/stage.hpp"

namespace progresshub {

// 실제 모델 호출 대신 정해진 문구를 돌려주는 에이전트.
class SimulatedAgent : public StageWorker {
 public:
  explicit SimulatedAgent(AgentDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

  StageOutcome Run(const StageInput& input) override;
  std::uint64_t Invocations() const { return invocations_.load(); }

 private:
  AgentDescriptor descriptor_;
  std::atomic<std::uint64_t> invocations_{0};
};

const std::vector<AgentDescriptor>& ResearchAgentDescriptors();
void RegisterResearchAgents(AgentRegistry& registry);

// scale_percent는 기본 단계 시간에 곱해지는 백분율이다 (100 = 원래 시간).
SharedStagePlan DefaultResearchPipeline(std::size_t scale_percent);

}  // namespace progresshub
