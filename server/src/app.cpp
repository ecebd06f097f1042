/*
 * 설명: 서버 구성 요소를 조립하고 리스닝/워커 스레드 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "mystery/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "mystery/db_client.hpp"
#include "mystery/http_session.hpp"
#include "mystery/mariadb_game_store.hpp"
#include "mystery/memory_game_store.hpp"

namespace mystery {

namespace {
constexpr std::size_t kNarrationThreads = 2;
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<GameService> game_service, std::shared_ptr<PhaseStateMachine> phases,
           std::shared_ptr<ClueProtocol> clues, std::shared_ptr<ChatService> chat,
           std::shared_ptr<GameCoordinator> coordinator, std::shared_ptr<ConnectionRegistry> registry,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), game_service_(std::move(game_service)),
        phases_(std::move(phases)), clues_(std::move(clues)), chat_(std::move(chat)),
        coordinator_(std::move(coordinator)), registry_(std::move(registry)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->game_service_, self->phases_,
                                          self->clues_, self->chat_, self->coordinator_, self->registry_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<GameService> game_service_;
  std::shared_ptr<PhaseStateMachine> phases_;
  std::shared_ptr<ClueProtocol> clues_;
  std::shared_ptr<ChatService> chat_;
  std::shared_ptr<GameCoordinator> coordinator_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<GameStore> store,
                     std::shared_ptr<LanguageModelProvider> provider)
    : config_(config),
      ioc_(1),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      narration_pool_(kNarrationThreads),
      store_(std::move(store)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));

  // 스토리 카탈로그는 리스닝 전에 적재를 마치고 이후로는 읽기 전용이다.
  const auto loaded = catalog_.LoadDirectory(config.stories_dir);
  observability_->LogEvent(LogLevel::kInfo, "stories_loaded", {{"count", loaded}, {"dir", config.stories_dir}});

  if (!store_) {
    if (config.store_backend == "memory") {
      store_ = std::make_shared<MemoryGameStore>();
    } else {
      DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
      store_ = std::make_shared<MariaDbGameStore>(std::make_shared<MariaDbClient>(db_config));
    }
  }
  if (!provider) {
    provider = std::make_shared<GeminiProvider>(GeminiConfig{.host = config.llm_host,
                                                             .port = config.llm_port,
                                                             .model = config.llm_model,
                                                             .api_key = config.llm_api_key,
                                                             .temperature = config.llm_temperature,
                                                             .timeout = std::chrono::seconds(config.llm_timeout_seconds)});
  }

  locks_ = std::make_shared<SessionLocks>();
  registry_ = std::make_shared<ConnectionRegistry>(store_, observability_);
  game_service_ = std::make_shared<GameService>(catalog_, store_, locks_);
  phases_ = std::make_shared<PhaseStateMachine>(catalog_, store_, locks_);
  clues_ = std::make_shared<ClueProtocol>(catalog_, store_, locks_, registry_, observability_);
  votes_ = std::make_shared<VoteProtocol>(catalog_, store_, locks_, registry_, observability_);
  chat_ = std::make_shared<ChatService>(store_, registry_);
  narrator_ = std::make_shared<NarrativeOrchestrator>(catalog_, std::move(provider), observability_);
  coordinator_ = std::make_shared<GameCoordinator>(narration_pool_.get_executor(),
                                                   CoordinatorDeps{.store = store_,
                                                                   .locks = locks_,
                                                                   .registry = registry_,
                                                                   .phases = phases_,
                                                                   .clues = clues_,
                                                                   .votes = votes_,
                                                                   .chat = chat_,
                                                                   .narrator = narrator_,
                                                                   .observability = observability_},
                                                   config.narrate_on_phase_change);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, game_service_, phases_, clues_, chat_,
                                           coordinator_, registry_, observability_);
    listener_->Run();
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(2u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  narration_pool_.stop();
  narration_pool_.join();
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.store_backend = get_env("STORE_BACKEND", "mariadb");
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "mystery_db");
  cfg.stories_dir = get_env("STORIES_DIR", "server/stories");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.llm_host = get_env("LLM_HOST", "generativelanguage.googleapis.com");
  cfg.llm_port = get_env("LLM_PORT", "443");
  cfg.llm_model = get_env("LLM_MODEL", "gemini-2.0-flash-exp");
  cfg.llm_api_key = get_env("LLM_API_KEY", "");
  cfg.llm_temperature = std::stod(get_env("LLM_TEMPERATURE", "0.7"));
  cfg.llm_timeout_seconds = static_cast<std::size_t>(std::stoul(get_env("LLM_TIMEOUT_SECONDS", "30")));
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "64")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "262144")));
  cfg.narrate_on_phase_change = get_env("NARRATE_ON_PHASE_CHANGE", "true") == "true";
  return cfg;
}

}  // namespace mystery
