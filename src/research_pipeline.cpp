/*
 * 설명: 연구/데이터/실험/검토/시각화 다섯 단계의 기본 파이프라인과 모의 에이전트를 구성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/agent_registry_test.cpp
 */
#include "progresshub/research_pipeline.hpp"

#include <sstream>

namespace progresshub {

namespace {
struct DefaultStage {
  const char* name;
  const char* agent_type;
  long seconds;
  const char* message;
};

constexpr DefaultStage kDefaultStages[] = {
    {"Research", "research", 3, "Research agent is discovering data sources..."},
    {"Data", "data", 4, "Data agent is fetching and processing datasets..."},
    {"Experiment", "experiment", 5, "Experiment agent is running analyses..."},
    {"Critic", "critic", 3, "Critic agent is validating methodology and results..."},
    {"Visualization", "visualization", 2, "Visualization agent is building the report..."},
};
}  // namespace

StageOutcome SimulatedAgent::Run(const StageInput& input) {
  invocations_.fetch_add(1);
  std::ostringstream oss;
  oss << descriptor_.name << " processed \"" << input.input << "\"";
  if (!input.previous_outputs.empty()) {
    oss << " using " << input.previous_outputs.size() << " prior result(s)";
  }
  return StageOutcome::Success(oss.str());
}

const std::vector<AgentDescriptor>& ResearchAgentDescriptors() {
  static const std::vector<AgentDescriptor> descriptors{
      {"research", "Research Agent", "Specialized agent for discovering data sources and research information"},
      {"data", "Data Agent", "Specialized agent for fetching and processing data"},
      {"experiment", "Experiment Agent", "Specialized agent for designing and running experiments"},
      {"critic", "Critic Agent", "Specialized agent for validating results and methodology"},
      {"visualization", "Visualization Agent", "Specialized agent for creating charts and reports"},
  };
  return descriptors;
}

void RegisterResearchAgents(AgentRegistry& registry) {
  for (const auto& descriptor : ResearchAgentDescriptors()) {
    registry.RegisterFactory(descriptor, [descriptor]() { return std::make_shared<SimulatedAgent>(descriptor); });
  }
}

SharedStagePlan DefaultResearchPipeline(std::size_t scale_percent) {
  auto plan = std::make_shared<StagePlan>();
  for (const auto& stage : kDefaultStages) {
    const long long base_ms = static_cast<long long>(stage.seconds) * 1000;
    auto scaled = std::chrono::milliseconds(base_ms * static_cast<long long>(scale_percent) / 100);
    plan->push_back(StageDescriptor{stage.name, stage.agent_type, scaled, stage.message});
  }
  return plan;
}

}  // namespace progresshub
