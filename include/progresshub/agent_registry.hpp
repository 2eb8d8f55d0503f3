/*
 * 설명: 에이전트 유형별 작업자를 최초 사용 시 한 번만 생성해 캐시하고 상태를 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/agent_registry_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "progresshub/stage.hpp"

namespace progresshub {

struct AgentDescriptor {
  std::string agent_type;
  std::string name;
  std::string description;
};

struct AgentStatus {
  std::string agent_type;
  std::string status;
  std::optional<AgentDescriptor> descriptor;
  std::uint64_t acquisitions{0};
};

nlohmann::json ToJson(const AgentStatus& status, const std::string& model_id);

class AgentRegistry {
 public:
  using Factory = std::function<std::shared_ptr<StageWorker>()>;

  bool RegisterFactory(const AgentDescriptor& descriptor, Factory factory);
  std::shared_ptr<StageWorker> GetOrCreate(const std::string& agent_type);
  std::shared_ptr<StageWorker> Find(const std::string& agent_type) const;
  AgentStatus Status(const std::string& agent_type) const;
  std::vector<AgentStatus> AllStatuses() const;
  std::vector<std::string> AgentTypes() const;

 private:
  struct Slot {
    AgentDescriptor descriptor;
    Factory factory;
    std::shared_ptr<StageWorker> instance;
    std::uint64_t acquisitions{0};
  };

  AgentStatus StatusLocked(const std::string& agent_type) const;

  std::map<std::string, Slot> slots_;
  mutable std::mutex mutex_;
};

}  // namespace progresshub
