/*
 * 설명: 에이전트 팩토리 등록, 지연 생성, 상태 조회를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/agent_registry_test.cpp
 */
#include "progresshub/agent_registry.hpp"

namespace progresshub {

nlohmann::json ToJson(const AgentStatus& status, const std::string& model_id) {
  nlohmann::json j{{"agent_type", status.agent_type}, {"status", status.status}};
  if (!status.descriptor) {
    j["name"] = nullptr;
    j["description"] = nullptr;
    return j;
  }
  j["name"] = status.descriptor->name;
  j["description"] = status.descriptor->description;
  if (status.status == "ready") {
    j["agent_id"] = status.agent_type + "_agent";
    j["model_id"] = model_id;
    j["acquisitions"] = status.acquisitions;
  }
  return j;
}

bool AgentRegistry::RegisterFactory(const AgentDescriptor& descriptor, Factory factory) {
  if (descriptor.agent_type.empty() || !factory) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = slots_.try_emplace(descriptor.agent_type);
  if (!inserted) {
    return false;
  }
  it->second.descriptor = descriptor;
  it->second.factory = std::move(factory);
  return true;
}

std::shared_ptr<StageWorker> AgentRegistry::GetOrCreate(const std::string& agent_type) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(agent_type);
  if (it == slots_.end()) {
    return nullptr;
  }
  auto& slot = it->second;
  if (!slot.instance) {
    slot.instance = slot.factory();
    if (!slot.instance) {
      return nullptr;
    }
  }
  ++slot.acquisitions;
  return slot.instance;
}

std::shared_ptr<StageWorker> AgentRegistry::Find(const std::string& agent_type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(agent_type);
  if (it == slots_.end()) {
    return nullptr;
  }
  return it->second.instance;
}

AgentStatus AgentRegistry::Status(const std::string& agent_type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return StatusLocked(agent_type);
}

std::vector<AgentStatus> AgentRegistry::AllStatuses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AgentStatus> statuses;
  statuses.reserve(slots_.size());
  for (const auto& [agent_type, slot] : slots_) {
    statuses.push_back(StatusLocked(agent_type));
  }
  return statuses;
}

std::vector<std::string> AgentRegistry::AgentTypes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> types;
  types.reserve(slots_.size());
  for (const auto& [agent_type, slot] : slots_) {
    types.push_back(agent_type);
  }
  return types;
}

AgentStatus AgentRegistry::StatusLocked(const std::string& agent_type) const {
  auto it = slots_.find(agent_type);
  if (it == slots_.end()) {
    return AgentStatus{agent_type, "unknown", std::nullopt, 0};
  }
  const auto& slot = it->second;
  return AgentStatus{agent_type, slot.instance ? "ready" : "not_created", slot.descriptor, slot.acquisitions};
}

}  // namespace progresshub
