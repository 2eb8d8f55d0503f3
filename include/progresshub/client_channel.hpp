/*
 * 설명: 레지스트리가 소유하는 양방향 클라이언트 채널 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <string>

namespace progresshub {

class ClientChannel {
 public:
  virtual ~ClientChannel() = default;

  // 직렬화된 메시지를 전송 큐에 넣는다. 채널이 닫혔거나 손상되었으면 false.
  virtual bool Send(std::string message) = 0;
  virtual void Close() = 0;
};

}  // namespace progresshub
