/*
 * 설명: MariaDB 연결, 쿼리 실행 헬퍼와 일시 오류 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_game_store_it_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

namespace mystery {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

using DbRow = std::vector<std::optional<std::string>>;

class MariaDbClient {
 public:
  static constexpr unsigned int kDuplicateEntry = 1062;

  explicit MariaDbClient(const DbConfig& config);

  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  // 실패하면 DbException을 던진다. 중복 키는 allow_duplicate일 때만 false로 돌려준다.
  bool Execute(MYSQL* conn, const std::string& sql, const std::string& ctx, bool allow_duplicate = false) const;
  std::vector<DbRow> Select(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;
  std::string Quote(MYSQL* conn, const std::string& value) const;
  std::string QuoteOrNull(MYSQL* conn, const std::optional<std::string>& value) const;

 private:
  MYSQL* Connect() const;
  // 재시도 가능한 DbException이면 지수 백오프 후 새 연결로 다시 시도한다.
  bool RunWithRetry(const std::function<bool(MYSQL*)>& work, bool transactional) const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace mystery
