/*
 * 설명: 클라이언트 식별자별 채널을 관리하고 단일 전송/브로드캐스트를 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "progresshub/client_channel.hpp"
#include "progresshub/envelope.hpp"
#include "progresshub/observability.hpp"

namespace progresshub {

class ConnectionRegistry : public std::enable_shared_from_this<ConnectionRegistry> {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  void Connect(const std::string& client_id, const std::shared_ptr<ClientChannel>& channel);
  bool Disconnect(const std::string& client_id);
  // 해당 id가 아직 channel을 가리킬 때만 제거한다.
  bool Disconnect(const std::string& client_id, const ClientChannel* channel);
  bool Unicast(const std::string& client_id, const Envelope& env);
  std::size_t Broadcast(const Envelope& env);
  std::size_t Count() const;

 private:
  void RemoveIfSame(const std::string& client_id, const ClientChannel* channel, const char* reason);
  void PublishCountLocked();

  std::unordered_map<std::string, std::shared_ptr<ClientChannel>> connections_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace progresshub
