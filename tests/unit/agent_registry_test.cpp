#include <memory>

#include <gtest/gtest.h>

#include "progresshub/agent_registry.hpp"
#include "progresshub/research_pipeline.hpp"

namespace {

progresshub::AgentDescriptor Descriptor(const std::string& type) {
  return progresshub::AgentDescriptor{type, type + " Agent", "test agent"};
}

}  // namespace

TEST(AgentRegistryTest, CreatesInstanceOnceOnFirstUse) {
  progresshub::AgentRegistry registry;
  int created = 0;
  ASSERT_TRUE(registry.RegisterFactory(Descriptor("research"), [&created]() {
    ++created;
    return std::make_shared<progresshub::SimulatedAgent>(Descriptor("research"));
  }));

  EXPECT_EQ(registry.Find("research"), nullptr);
  EXPECT_EQ(registry.Status("research").status, "not_created");

  auto first = registry.GetOrCreate("research");
  auto second = registry.GetOrCreate("research");
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first, second);
  EXPECT_EQ(created, 1);
  EXPECT_EQ(registry.Find("research"), first);

  auto status = registry.Status("research");
  EXPECT_EQ(status.status, "ready");
  EXPECT_EQ(status.acquisitions, 2u);
}

TEST(AgentRegistryTest, UnknownTypeYieldsNothing) {
  progresshub::AgentRegistry registry;
  EXPECT_EQ(registry.GetOrCreate("ghost"), nullptr);
  auto status = registry.Status("ghost");
  EXPECT_EQ(status.status, "unknown");
  EXPECT_FALSE(status.descriptor.has_value());
}

TEST(AgentRegistryTest, RejectsDuplicateAndInvalidRegistration) {
  progresshub::AgentRegistry registry;
  auto factory = []() { return std::make_shared<progresshub::SimulatedAgent>(Descriptor("data")); };
  EXPECT_TRUE(registry.RegisterFactory(Descriptor("data"), factory));
  EXPECT_FALSE(registry.RegisterFactory(Descriptor("data"), factory));
  EXPECT_FALSE(registry.RegisterFactory(Descriptor(""), factory));
  EXPECT_FALSE(registry.RegisterFactory(Descriptor("critic"), nullptr));
  EXPECT_EQ(registry.AgentTypes().size(), 1u);
}

TEST(AgentRegistryTest, NullFactoryResultIsRetried) {
  progresshub::AgentRegistry registry;
  bool fail = true;
  registry.RegisterFactory(Descriptor("critic"), [&fail]() -> std::shared_ptr<progresshub::StageWorker> {
    if (fail) {
      return nullptr;
    }
    return std::make_shared<progresshub::SimulatedAgent>(Descriptor("critic"));
  });
  EXPECT_EQ(registry.GetOrCreate("critic"), nullptr);
  EXPECT_EQ(registry.Status("critic").status, "not_created");
  fail = false;
  EXPECT_NE(registry.GetOrCreate("critic"), nullptr);
}

TEST(AgentRegistryTest, StatusJsonIncludesModelWhenReady) {
  progresshub::AgentRegistry registry;
  progresshub::RegisterResearchAgents(registry);
  EXPECT_EQ(registry.AgentTypes().size(), 5u);

  auto idle = progresshub::ToJson(registry.Status("data"), "sim-model");
  EXPECT_EQ(idle["status"], "not_created");
  EXPECT_FALSE(idle.contains("model_id"));

  registry.GetOrCreate("data");
  auto ready = progresshub::ToJson(registry.Status("data"), "sim-model");
  EXPECT_EQ(ready["status"], "ready");
  EXPECT_EQ(ready["agent_id"], "data_agent");
  EXPECT_EQ(ready["model_id"], "sim-model");
  EXPECT_EQ(ready["name"], "Data Agent");
}

TEST(ResearchPipelineTest, DefaultPlanOrderAndScaling) {
  auto plan = progresshub::DefaultResearchPipeline(100);
  ASSERT_EQ(plan->size(), 5u);
  EXPECT_EQ((*plan)[0].name, "Research");
  EXPECT_EQ((*plan)[1].name, "Data");
  EXPECT_EQ((*plan)[2].name, "Experiment");
  EXPECT_EQ((*plan)[3].name, "Critic");
  EXPECT_EQ((*plan)[4].name, "Visualization");
  EXPECT_EQ((*plan)[0].duration, std::chrono::milliseconds(3000));
  EXPECT_EQ((*plan)[2].duration, std::chrono::milliseconds(5000));

  auto fast = progresshub::DefaultResearchPipeline(1);
  EXPECT_EQ((*fast)[0].duration, std::chrono::milliseconds(30));
  EXPECT_EQ((*fast)[4].duration, std::chrono::milliseconds(20));
}

TEST(ResearchPipelineTest, SimulatedAgentMentionsPriorResults) {
  progresshub::SimulatedAgent agent(Descriptor("experiment"));
  progresshub::StageInput input{"job_1", "u1", "quantum dots", {}};
  auto first = agent.Run(input);
  ASSERT_TRUE(first.ok);
  EXPECT_NE(first.output.find("quantum dots"), std::string::npos);
  EXPECT_EQ(first.output.find("prior"), std::string::npos);

  input.previous_outputs = {{"Research", "R"}, {"Data", "D"}};
  auto second = agent.Run(input);
  EXPECT_NE(second.output.find("using 2 prior result(s)"), std::string::npos);
  EXPECT_EQ(agent.Invocations(), 2u);
}
