/*
 * 설명: 클라이언트 명령을 분기하고 연결 종료 시 레지스트리에서 해제한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/command_handler_test.cpp
 */
#include "progresshub/command_handler.hpp"

namespace progresshub {

CommandHandler::CommandHandler(std::shared_ptr<ConnectionRegistry> registry,
                               std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), observability_(std::move(observability)) {}

CommandKind CommandHandler::HandleMessage(const std::string& client_id, std::string_view text) {
  auto command = ParseClientCommand(text);
  switch (command.kind) {
    case CommandKind::kPing:
      registry_->Unicast(client_id, MakePongEnvelope());
      break;
    case CommandKind::kSubscribe:
      // 구독은 확인만 하고 브로드캐스트 범위를 좁히지 않는다.
      registry_->Unicast(client_id, MakeSubscriptionConfirmedEnvelope(command.workflow_id));
      if (observability_) {
        observability_->Log(LogContext{.name = "ws.subscribe",
                                       .level = LogLevel::kDebug,
                                       .client_id = client_id,
                                       .workflow_id = command.workflow_id});
      }
      break;
    case CommandKind::kUnknown:
    case CommandKind::kPlainText:
      registry_->Unicast(client_id, MakeEchoEnvelope(command.raw));
      break;
  }
  return command.kind;
}

bool CommandHandler::HandleClosed(const std::string& client_id, const ClientChannel* channel) {
  // 교체된 채널이 늦게 닫히는 경우에는 새 연결이 남아 있으므로 기록하지 않는다.
  if (!registry_->Disconnect(client_id, channel)) {
    return false;
  }
  if (observability_) {
    observability_->Log(LogContext{.name = "ws.disconnected", .level = LogLevel::kInfo, .client_id = client_id});
  }
  return true;
}

}  // namespace progresshub
