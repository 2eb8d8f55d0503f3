#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "progresshub/client_channel.hpp"

namespace progresshub::test {

// 보낸 메시지를 기록하는 테스트용 채널. broken이면 Send가 실패한다.
class FakeChannel : public ClientChannel {
 public:
  bool Send(std::string message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (broken_) {
      ++rejected_;
      return false;
    }
    messages_.push_back(std::move(message));
    return true;
  }

  void Close() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++close_count_;
  }

  void Break() {
    std::lock_guard<std::mutex> lock(mutex_);
    broken_ = true;
  }

  std::vector<std::string> Messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

  std::vector<nlohmann::json> JsonMessages() const {
    std::vector<nlohmann::json> parsed;
    for (const auto& message : Messages()) {
      parsed.push_back(nlohmann::json::parse(message, nullptr, false));
    }
    return parsed;
  }

  int CloseCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_count_;
  }

  int Rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> messages_;
  bool broken_{false};
  int close_count_{0};
  int rejected_{0};
};

}  // namespace progresshub::test
