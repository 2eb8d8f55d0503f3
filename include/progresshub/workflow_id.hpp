/*
 * 설명: 충돌에 강한 워크플로 식별자를 발급한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/workflow_engine_test.cpp
 */
#pragma once

#include <string>

namespace progresshub {

// "workflow_" + 128비트 난수 16진수. RNG 실패 시 std::runtime_error.
std::string GenerateWorkflowId();

}  // namespace progresshub
