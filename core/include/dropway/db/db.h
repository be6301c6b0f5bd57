#pragma once

#include <libpq-fe.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dropway::db {

class DbError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct DbConfig {
  std::string host;
  std::string port = "5432";
  std::string user;
  std::string password;
  std::string name;
};

// DROPWAY_DB_HOST, DROPWAY_DB_PORT, DROPWAY_DB_USER, DROPWAY_DB_PASSWORD, DROPWAY_DB_NAME
DbConfig load_db_config_from_env();

// True when DROPWAY_DB_HOST is set, i.e. the durable resume store was asked for.
bool db_configured();

// Owns a PGresult that already passed the status check. Values are text format.
class Result {
 public:
  Result(PGresult* r, std::string ctx);

  int rows() const;
  bool empty() const { return rows() == 0; }

  // Throws DbError for NULL or out-of-range cells, and for text that is not a
  // number in range.
  std::string text(int row, int col) const;
  uint32_t u32(int row, int col) const;

  // Rows touched by INSERT/UPDATE/DELETE.
  uint64_t affected() const;

 private:
  struct Clear {
    void operator()(PGresult* r) const { PQclear(r); }
  };
  std::unique_ptr<PGresult, Clear> res_;
  std::string ctx_;
};

class Db {
 public:
  explicit Db(DbConfig cfg);
  ~Db();

  Db(const Db&) = delete;
  Db& operator=(const Db&) = delete;

  void connect();
  bool is_connected() const;

  // PQexecParams with text parameters. `ctx` prefixes error messages.
  // Throws DbError when the server rejects the statement.
  Result query(const std::string& ctx, const std::string& sql, const std::vector<std::string>& params = {});

  // query() for statements without a row set; returns the affected row count.
  uint64_t command(const std::string& ctx, const std::string& sql, const std::vector<std::string>& params = {});

 private:
  void ensure_connected();

  DbConfig cfg_;
  PGconn* conn_ = nullptr;
};

} // namespace dropway::db
