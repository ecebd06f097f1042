/*
 * 설명: 서버 전체 수명주기(구성 요소 조립, 리스닝, 워커 스레드)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "mystery/chat_service.hpp"
#include "mystery/clue_protocol.hpp"
#include "mystery/config.hpp"
#include "mystery/game_coordinator.hpp"
#include "mystery/game_service.hpp"
#include "mystery/game_store.hpp"
#include "mystery/llm_provider.hpp"
#include "mystery/narrative.hpp"
#include "mystery/observability.hpp"
#include "mystery/phase_machine.hpp"
#include "mystery/realtime.hpp"
#include "mystery/session_locks.hpp"
#include "mystery/story_catalog.hpp"
#include "mystery/vote_protocol.hpp"

namespace mystery {

class Listener;

class ServerApp {
 public:
  // store가 없으면 설정(store_backend)에 따라 생성한다. provider도 같다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<GameStore> store = nullptr,
                     std::shared_ptr<LanguageModelProvider> provider = nullptr);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  StoryCatalog& GetCatalog() { return catalog_; }
  std::shared_ptr<GameStore> GetStore() { return store_; }
  std::shared_ptr<ConnectionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  // 외부 모델 호출 전용. I/O 스레드를 막지 않는다.
  boost::asio::thread_pool narration_pool_;
  std::shared_ptr<Listener> listener_;
  StoryCatalog catalog_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<SessionLocks> locks_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<GameService> game_service_;
  std::shared_ptr<PhaseStateMachine> phases_;
  std::shared_ptr<ClueProtocol> clues_;
  std::shared_ptr<VoteProtocol> votes_;
  std::shared_ptr<ChatService> chat_;
  std::shared_ptr<NarrativeOrchestrator> narrator_;
  std::shared_ptr<GameCoordinator> coordinator_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace mystery
