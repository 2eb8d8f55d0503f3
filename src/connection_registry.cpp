/*
 * 설명: 클라이언트 채널 등록/해제와 단일 전송, 스냅샷 기반 브로드캐스트를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/connection_registry_test.cpp
 */
#include "progresshub/connection_registry.hpp"

#include <utility>
#include <vector>

namespace progresshub {

void ConnectionRegistry::Connect(const std::string& client_id, const std::shared_ptr<ClientChannel>& channel) {
  std::shared_ptr<ClientChannel> replaced;
  bool accepted = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = connections_[client_id];
    if (slot && slot != channel) {
      replaced = std::move(slot);
    }
    slot = channel;
    // 등록과 같은 임계구역에서 넣어야 이후 브로드캐스트보다 connection 메시지가 먼저 나간다.
    if (!channel->Send(Serialize(MakeConnectionEnvelope(client_id)))) {
      connections_.erase(client_id);
      accepted = false;
    }
    PublishCountLocked();
  }
  if (replaced) {
    replaced->Close();
    if (observability_) {
      observability_->Log(LogContext{.name = "ws.replaced", .level = LogLevel::kInfo, .client_id = client_id});
    }
  }
  if (!observability_) {
    return;
  }
  if (accepted) {
    observability_->Log(LogContext{.name = "ws.connected", .level = LogLevel::kInfo, .client_id = client_id});
  } else {
    observability_->IncrementDeliveryFailure();
    observability_->Log(LogContext{.name = "ws.delivery_failed",
                                   .level = LogLevel::kWarn,
                                   .client_id = client_id,
                                   .detail = std::string("connection envelope rejected")});
  }
}

bool ConnectionRegistry::Disconnect(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connections_.erase(client_id) == 0) {
    return false;
  }
  PublishCountLocked();
  return true;
}

bool ConnectionRegistry::Disconnect(const std::string& client_id, const ClientChannel* channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(client_id);
  if (it == connections_.end() || it->second.get() != channel) {
    return false;
  }
  connections_.erase(it);
  PublishCountLocked();
  return true;
}

bool ConnectionRegistry::Unicast(const std::string& client_id, const Envelope& env) {
  std::shared_ptr<ClientChannel> channel;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(client_id);
    if (it == connections_.end()) {
      return false;
    }
    channel = it->second;
  }
  if (channel->Send(Serialize(env))) {
    return true;
  }
  RemoveIfSame(client_id, channel.get(), "unicast failed");
  return false;
}

std::size_t ConnectionRegistry::Broadcast(const Envelope& env) {
  std::vector<std::pair<std::string, std::shared_ptr<ClientChannel>>> recipients;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connections_.empty()) {
      return 0;
    }
    recipients.reserve(connections_.size());
    for (const auto& [client_id, channel] : connections_) {
      recipients.emplace_back(client_id, channel);
    }
  }
  if (observability_) {
    observability_->IncrementBroadcast();
  }

  const auto message = Serialize(env);
  std::size_t delivered = 0;
  std::vector<std::pair<std::string, const ClientChannel*>> failed;
  for (const auto& [client_id, channel] : recipients) {
    if (channel->Send(message)) {
      ++delivered;
    } else {
      failed.emplace_back(client_id, channel.get());
    }
  }
  for (const auto& [client_id, channel] : failed) {
    RemoveIfSame(client_id, channel, "broadcast failed");
  }
  return delivered;
}

std::size_t ConnectionRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

void ConnectionRegistry::RemoveIfSame(const std::string& client_id, const ClientChannel* channel,
                                      const char* reason) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(client_id);
    if (it != connections_.end() && it->second.get() == channel) {
      connections_.erase(it);
      PublishCountLocked();
      removed = true;
    }
  }
  if (observability_) {
    observability_->IncrementDeliveryFailure();
    observability_->Log(LogContext{.name = "ws.delivery_failed",
                                   .level = LogLevel::kWarn,
                                   .client_id = client_id,
                                   .detail = std::string(reason) + (removed ? ", removed" : ", already gone")});
  }
}

void ConnectionRegistry::PublishCountLocked() {
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

}  // namespace progresshub
