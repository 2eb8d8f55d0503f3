/*
 * 설명: 알림 엔벨로프를 직렬화하고 수신 메시지를 명령으로 분류한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/envelope_codec_test.cpp
 */
#include "progresshub/envelope.hpp"

#include <atomic>
#include <chrono>

namespace progresshub {

namespace {
constexpr std::string_view kEchoPrefix = "Received: ";

std::atomic<long long> last_timestamp_ms{0};

Envelope MakeEnvelope(EnvelopeType type, nlohmann::json fields) {
  return Envelope{type, std::move(fields), NextTimestamp()};
}
}  // namespace

std::string_view EnvelopeTypeName(EnvelopeType type) {
  switch (type) {
    case EnvelopeType::kConnection:
      return "connection";
    case EnvelopeType::kPong:
      return "pong";
    case EnvelopeType::kSubscriptionConfirmed:
      return "subscription_confirmed";
    case EnvelopeType::kAgentStatus:
      return "agent_status";
    case EnvelopeType::kWorkflowCompleted:
      return "workflow_completed";
    case EnvelopeType::kWorkflowFailed:
      return "workflow_failed";
    case EnvelopeType::kEcho:
      return "echo";
  }
  return "unknown";
}

double NextTimestamp() {
  auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();
  auto prev = last_timestamp_ms.load();
  while (prev < now_ms && !last_timestamp_ms.compare_exchange_weak(prev, now_ms)) {
  }
  // 벽시계가 뒤로 가면 마지막 값을 유지한다.
  auto stamped = prev < now_ms ? now_ms : prev;
  return static_cast<double>(stamped) / 1000.0;
}

std::string Serialize(const Envelope& env) {
  if (env.type == EnvelopeType::kEcho) {
    std::string text(kEchoPrefix);
    if (env.fields.contains("content") && env.fields["content"].is_string()) {
      text += env.fields["content"].get<std::string>();
    }
    return text;
  }
  nlohmann::json j = nlohmann::json::object();
  j["type"] = std::string(EnvelopeTypeName(env.type));
  if (env.fields.is_object()) {
    for (auto it = env.fields.begin(); it != env.fields.end(); ++it) {
      if (it.key() == "type" || it.key() == "timestamp") {
        continue;
      }
      j[it.key()] = it.value();
    }
  }
  j["timestamp"] = env.timestamp;
  return j.dump();
}

Envelope MakeConnectionEnvelope(const std::string& client_id) {
  return MakeEnvelope(EnvelopeType::kConnection,
                      {{"status", "connected"},
                       {"client_id", client_id},
                       {"message", "WebSocket connection established"}});
}

Envelope MakePongEnvelope() { return MakeEnvelope(EnvelopeType::kPong, nlohmann::json::object()); }

Envelope MakeSubscriptionConfirmedEnvelope(const std::string& workflow_id) {
  return MakeEnvelope(EnvelopeType::kSubscriptionConfirmed,
                      {{"workflow_id", workflow_id}, {"status", "subscribed"}});
}

Envelope MakeEchoEnvelope(std::string_view text) {
  return MakeEnvelope(EnvelopeType::kEcho, {{"content", std::string(text)}});
}

Envelope MakeAgentStatusEnvelope(const AgentStatusUpdate& update) {
  nlohmann::json fields{{"workflow_id", update.workflow_id},
                        {"agent_name", update.agent_name},
                        {"status", update.status},
                        {"message", update.message},
                        {"progress_percentage", update.progress_percentage},
                        {"user_id", update.user_id}};
  if (!update.result.empty()) {
    fields["result"] = update.result;
  }
  return MakeEnvelope(EnvelopeType::kAgentStatus, std::move(fields));
}

Envelope MakeWorkflowCompletedEnvelope(const WorkflowSummary& summary) {
  nlohmann::json results{{"stages_completed", summary.stages_completed},
                         {"total_duration_ms", summary.total_duration_ms},
                         {"summary", summary.summary},
                         {"outputs", summary.outputs.is_null() ? nlohmann::json::object() : summary.outputs}};
  return MakeEnvelope(EnvelopeType::kWorkflowCompleted,
                      {{"workflow_id", summary.workflow_id},
                       {"status", "completed"},
                       {"message", summary.summary},
                       {"progress_percentage", 100.0},
                       {"user_id", summary.user_id},
                       {"results", results}});
}

Envelope MakeWorkflowFailedEnvelope(const WorkflowFailure& failure) {
  return MakeEnvelope(EnvelopeType::kWorkflowFailed,
                      {{"workflow_id", failure.workflow_id},
                       {"status", "failed"},
                       {"agent_name", failure.agent_name},
                       {"error", failure.error},
                       {"message", failure.agent_name + " failed: " + failure.error},
                       {"progress_percentage", failure.progress_percentage},
                       {"user_id", failure.user_id}});
}

ClientCommand ParseClientCommand(std::string_view text) {
  ClientCommand command{CommandKind::kPlainText, {}, std::string(text)};
  auto message = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    return command;
  }
  command.kind = CommandKind::kUnknown;
  auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    return command;
  }
  if (*type_it == "ping") {
    command.kind = CommandKind::kPing;
  } else if (*type_it == "subscribe") {
    auto id_it = message.find("workflow_id");
    if (id_it != message.end() && id_it->is_string()) {
      command.kind = CommandKind::kSubscribe;
      command.workflow_id = id_it->get<std::string>();
    }
  }
  return command;
}

}  // namespace progresshub
