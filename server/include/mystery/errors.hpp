/*
 * 설명: 프로토콜 위반을 호출자에게 동기적으로 전달하기 위한 오류 분류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_service_test.cpp, server/tests/unit/phase_machine_test.cpp
 */
#pragma once

#include <string>

namespace mystery {

enum class ErrorKind {
  kNone,
  kBadRequest,
  kNotFound,
  kUnauthorized,
  kConflict,
  kPreconditionFailed,
  kInternal,
};

struct OpError {
  ErrorKind kind{ErrorKind::kNone};
  std::string code;
  std::string message;

  void Set(ErrorKind k, std::string c, std::string m) {
    kind = k;
    code = std::move(c);
    message = std::move(m);
  }
  bool Empty() const { return kind == ErrorKind::kNone; }
};

// HTTP 상태 코드로 매핑한다. kNone은 200.
unsigned int HttpStatusFor(ErrorKind kind);

}  // namespace mystery
