/*
 * 설명: 세션별 뮤텍스 발급을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "mystery/session_locks.hpp"

namespace mystery {

std::shared_ptr<std::mutex> SessionLocks::For(const std::string& game_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = locks_[game_id];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

std::size_t SessionLocks::Size() {
  std::lock_guard<std::mutex> lock(mutex_);
  return locks_.size();
}

}  // namespace mystery
