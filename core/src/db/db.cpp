#include "dropway/db/db.h"
#include <cerrno>
#include <cstdlib>

namespace dropway::db {

Result::Result(PGresult* r, std::string ctx) : res_(r), ctx_(std::move(ctx)) {
  if (!res_) throw DbError(ctx_ + ": no result");
  auto st = PQresultStatus(res_.get());
  if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
    throw DbError(ctx_ + ": " + PQresultErrorMessage(res_.get()));
  }
}

int Result::rows() const {
  return PQntuples(res_.get());
}

std::string Result::text(int row, int col) const {
  if (row < 0 || row >= rows() || col < 0 || col >= PQnfields(res_.get())) {
    throw DbError(ctx_ + ": no cell " + std::to_string(row) + "," + std::to_string(col));
  }
  if (PQgetisnull(res_.get(), row, col)) {
    throw DbError(ctx_ + ": " + PQfname(res_.get(), col) + " is NULL");
  }
  return std::string(PQgetvalue(res_.get(), row, col), PQgetlength(res_.get(), row, col));
}

uint32_t Result::u32(int row, int col) const {
  const std::string s = text(row, col);
  char* end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (s.empty() || s[0] == '-' || *end != '\0' || errno == ERANGE || v > UINT32_MAX) {
    throw DbError(ctx_ + ": " + PQfname(res_.get(), col) + " is not a count: " + s);
  }
  return static_cast<uint32_t>(v);
}

uint64_t Result::affected() const {
  const char* n = PQcmdTuples(res_.get());
  return (n && *n) ? std::strtoull(n, nullptr, 10) : 0;
}

Db::Db(DbConfig cfg) : cfg_(std::move(cfg)) {}

Db::~Db() {
  if (conn_) PQfinish(conn_);
}

void Db::connect() {
  if (conn_) PQfinish(conn_);
  // keyword arrays need no quoting of passwords with spaces or quotes
  const char* keys[] = {"host", "port", "dbname", "user", "password", "connect_timeout", nullptr};
  const char* values[] = {cfg_.host.c_str(), cfg_.port.c_str(), cfg_.name.c_str(), cfg_.user.c_str(),
                          cfg_.password.c_str(), "10", nullptr};
  conn_ = PQconnectdbParams(keys, values, 0);
  if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
    std::string err = conn_ ? PQerrorMessage(conn_) : "out of memory";
    throw DbError("connect to " + cfg_.host + ":" + cfg_.port + "/" + cfg_.name + " failed: " + err);
  }
}

bool Db::is_connected() const {
  return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void Db::ensure_connected() {
  if (is_connected()) return;
  if (!conn_) throw DbError("not connected");
  // one reset when the server dropped us
  PQreset(conn_);
  if (!is_connected()) throw DbError(std::string("connection lost: ") + PQerrorMessage(conn_));
}

Result Db::query(const std::string& ctx, const std::string& sql, const std::vector<std::string>& params) {
  ensure_connected();
  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& p : params) values.push_back(p.c_str());
  return Result(PQexecParams(conn_, sql.c_str(), static_cast<int>(params.size()), nullptr,
                             values.empty() ? nullptr : values.data(), nullptr, nullptr, 0),
                ctx);
}

uint64_t Db::command(const std::string& ctx, const std::string& sql, const std::vector<std::string>& params) {
  return query(ctx, sql, params).affected();
}

} // namespace dropway::db
