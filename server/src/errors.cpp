/*
 * 설명: 오류 분류를 HTTP 상태 코드로 매핑한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "mystery/errors.hpp"

namespace mystery {

unsigned int HttpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return 200;
    case ErrorKind::kBadRequest:
      return 400;
    case ErrorKind::kNotFound:
      return 404;
    case ErrorKind::kUnauthorized:
      return 403;
    case ErrorKind::kConflict:
      return 409;
    case ErrorKind::kPreconditionFailed:
      return 412;
    case ErrorKind::kInternal:
      return 500;
  }
  return 500;
}

}  // namespace mystery
