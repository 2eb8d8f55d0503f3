/*
 * 설명: 클라이언트 수신 메시지(ping/subscribe/자유 텍스트)를 해석해 응답을 단일 전송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/command_handler_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "progresshub/client_channel.hpp"
#include "progresshub/connection_registry.hpp"
#include "progresshub/envelope.hpp"
#include "progresshub/observability.hpp"

namespace progresshub {

class CommandHandler {
 public:
  CommandHandler(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<Observability> observability);

  CommandKind HandleMessage(const std::string& client_id, std::string_view text);
  bool HandleClosed(const std::string& client_id, const ClientChannel* channel);

 private:
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace progresshub
