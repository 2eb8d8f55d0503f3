/*
 * 설명: 클라이언트에 푸시되는 알림 엔벨로프의 생성/직렬화와 수신 명령 해석을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/envelope_codec_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace progresshub {

enum class EnvelopeType {
  kConnection,
  kPong,
  kSubscriptionConfirmed,
  kAgentStatus,
  kWorkflowCompleted,
  kWorkflowFailed,
  kEcho,
};

std::string_view EnvelopeTypeName(EnvelopeType type);

struct Envelope {
  EnvelopeType type;
  nlohmann::json fields;
  double timestamp;
};

// 프로세스 전체에서 감소하지 않는 epoch 초 단위 타임스탬프(ms 해상도).
double NextTimestamp();

std::string Serialize(const Envelope& env);

Envelope MakeConnectionEnvelope(const std::string& client_id);
Envelope MakePongEnvelope();
Envelope MakeSubscriptionConfirmedEnvelope(const std::string& workflow_id);
Envelope MakeEchoEnvelope(std::string_view text);

struct AgentStatusUpdate {
  std::string workflow_id;
  std::string user_id;
  std::string agent_name;
  std::string status;
  std::string message;
  double progress_percentage{0.0};
  std::string result;
};

Envelope MakeAgentStatusEnvelope(const AgentStatusUpdate& update);

struct WorkflowSummary {
  std::string workflow_id;
  std::string user_id;
  std::size_t stages_completed{0};
  long long total_duration_ms{0};
  std::string summary;
  nlohmann::json outputs;
};

Envelope MakeWorkflowCompletedEnvelope(const WorkflowSummary& summary);

struct WorkflowFailure {
  std::string workflow_id;
  std::string user_id;
  std::string agent_name;
  std::string error;
  double progress_percentage{0.0};
};

Envelope MakeWorkflowFailedEnvelope(const WorkflowFailure& failure);

enum class CommandKind { kPing, kSubscribe, kUnknown, kPlainText };

struct ClientCommand {
  CommandKind kind;
  std::string workflow_id;
  std::string raw;
};

ClientCommand ParseClientCommand(std::string_view text);

}  // namespace progresshub
