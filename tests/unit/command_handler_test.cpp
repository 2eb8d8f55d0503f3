#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "progresshub/command_handler.hpp"
#include "unit/fake_channel.hpp"

using progresshub::CommandKind;
using progresshub::test::FakeChannel;

namespace {

class CommandHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = std::make_shared<progresshub::ConnectionRegistry>();
    handler_ = std::make_shared<progresshub::CommandHandler>(registry_, nullptr);
    channel_ = std::make_shared<FakeChannel>();
    registry_->Connect("c1", channel_);
  }

  std::shared_ptr<progresshub::ConnectionRegistry> registry_;
  std::shared_ptr<progresshub::CommandHandler> handler_;
  std::shared_ptr<FakeChannel> channel_;
};

}  // namespace

TEST_F(CommandHandlerTest, PingRepliesPong) {
  EXPECT_EQ(handler_->HandleMessage("c1", R"({"type":"ping"})"), CommandKind::kPing);
  auto messages = channel_->JsonMessages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[1]["type"], "pong");
  EXPECT_TRUE(messages[1]["timestamp"].is_number());
}

TEST_F(CommandHandlerTest, SubscribeIsConfirmed) {
  EXPECT_EQ(handler_->HandleMessage("c1", R"({"type":"subscribe","workflow_id":"job_42"})"),
            CommandKind::kSubscribe);
  auto messages = channel_->JsonMessages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[1]["type"], "subscription_confirmed");
  EXPECT_EQ(messages[1]["workflow_id"], "job_42");
  EXPECT_EQ(messages[1]["status"], "subscribed");
}

TEST_F(CommandHandlerTest, PlainTextIsEchoedOnce) {
  EXPECT_EQ(handler_->HandleMessage("c1", "not json at all"), CommandKind::kPlainText);
  auto messages = channel_->Messages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[1], "Received: not json at all");
}

TEST_F(CommandHandlerTest, UnknownTypeIsEchoedVerbatim) {
  const std::string raw = R"({"type":"dance"})";
  EXPECT_EQ(handler_->HandleMessage("c1", raw), CommandKind::kUnknown);
  auto messages = channel_->Messages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[1], "Received: " + raw);
}

TEST_F(CommandHandlerTest, RepliesGoOnlyToSender) {
  auto other = std::make_shared<FakeChannel>();
  registry_->Connect("c2", other);
  handler_->HandleMessage("c1", R"({"type":"ping"})");
  EXPECT_EQ(other->Messages().size(), 1u);
  EXPECT_EQ(channel_->Messages().size(), 2u);
}

TEST_F(CommandHandlerTest, ClosedChannelIsUnregistered) {
  EXPECT_TRUE(handler_->HandleClosed("c1", channel_.get()));
  EXPECT_EQ(registry_->Count(), 0u);
  EXPECT_FALSE(handler_->HandleClosed("c1", channel_.get()));
  EXPECT_EQ(registry_->Count(), 0u);
}

TEST_F(CommandHandlerTest, LateCloseOfReplacedChannelIsIgnored) {
  auto replacement = std::make_shared<FakeChannel>();
  registry_->Connect("c1", replacement);

  ::testing::internal::CaptureStdout();
  auto observability = std::make_shared<progresshub::Observability>(progresshub::LogLevel::kDebug);
  progresshub::CommandHandler handler(registry_, observability);
  EXPECT_FALSE(handler.HandleClosed("c1", channel_.get()));
  auto output = ::testing::internal::GetCapturedStdout();

  EXPECT_EQ(output.find("ws.disconnected"), std::string::npos);
  EXPECT_EQ(registry_->Count(), 1u);
  handler_->HandleMessage("c1", R"({"type":"ping"})");
  EXPECT_EQ(replacement->JsonMessages().back()["type"], "pong");
}
