/*
 * 설명: MariaDB 연결, 쿼리 실행과 재시도 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_game_store_it_test.cpp
 */
#include "mystery/db_client.hpp"

#include <chrono>
#include <thread>

#include <mariadb/errmsg.h>

namespace mystery {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    const unsigned int code = mysql_errno(conn);
    DbException error(std::string("연결 실패: ") + mysql_error(conn), code, IsRetryable(code));
    mysql_close(conn);
    throw error;
  }
  return conn;
}

namespace {
// 트랜잭션이 확정되지 않은 채 범위를 벗어나면 롤백 후 연결을 닫는다.
class ConnectionGuard {
 public:
  ConnectionGuard(MYSQL* conn, bool transactional) : conn_(conn), transactional_(transactional) {
    if (transactional_) {
      mysql_autocommit(conn_, 0);
    }
  }
  ~ConnectionGuard() {
    if (transactional_ && !settled_) {
      mysql_rollback(conn_);
    }
    mysql_close(conn_);
  }
  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;

  MYSQL* get() const { return conn_; }
  void MarkSettled() { settled_ = true; }

 private:
  MYSQL* conn_;
  bool transactional_;
  bool settled_{false};
};
}  // namespace

bool MariaDbClient::RunWithRetry(const std::function<bool(MYSQL*)>& work, bool transactional) const {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      ConnectionGuard guard(Connect(), transactional);
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      const bool commit = work(guard.get());
      if (transactional) {
        if (commit && mysql_commit(guard.get()) != 0) {
          RaiseError(guard.get(), "커밋 실패");
        }
        if (!commit) {
          mysql_rollback(guard.get());
        }
        guard.MarkSettled();
      }
      return commit;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
      Backoff(attempt);
    }
  }
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  return RunWithRetry(work, true);
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RunWithRetry(
      [&work](MYSQL* conn) {
        work(conn);
        return true;
      },
      false);
}

bool MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx, bool allow_duplicate) const {
  if (mysql_real_query(conn, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
    if (allow_duplicate && mysql_errno(conn) == kDuplicateEntry) {
      return false;
    }
    RaiseError(conn, ctx);
  }
  return true;
}

std::vector<DbRow> MariaDbClient::Select(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  Execute(conn, sql, ctx);
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  std::vector<DbRow> rows;
  unsigned int fields = mysql_num_fields(res);
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res)) != nullptr) {
    DbRow out;
    out.reserve(fields);
    for (unsigned int i = 0; i < fields; ++i) {
      out.push_back(row[i] ? std::optional<std::string>(row[i]) : std::nullopt);
    }
    rows.push_back(std::move(out));
  }
  mysql_free_result(res);
  return rows;
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

std::string MariaDbClient::Quote(MYSQL* conn, const std::string& value) const {
  return "'" + Escape(conn, value) + "'";
}

std::string MariaDbClient::QuoteOrNull(MYSQL* conn, const std::optional<std::string>& value) const {
  return value ? Quote(conn, *value) : std::string("NULL");
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace mystery
