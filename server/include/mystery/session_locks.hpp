/*
 * 설명: 게임 세션별로 독립된 뮤텍스를 발급한다. 읽기-검사-쓰기 연산은 해당 세션 뮤텍스 아래에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/clue_protocol_test.cpp, server/tests/unit/game_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mystery {

class SessionLocks {
 public:
  // 같은 game_id에는 항상 같은 뮤텍스를 돌려준다. 세션 수명 동안 회수하지 않는다.
  // 호출자는 저장소에 존재하는 game_id만 넘겨야 한다.
  std::shared_ptr<std::mutex> For(const std::string& game_id);
  std::size_t Size();

 private:
  std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace mystery
