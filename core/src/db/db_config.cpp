#include "dropway/db/db.h"
#include "dropway/common/config.h"

namespace dropway::db {

DbConfig load_db_config_from_env() {
  DbConfig cfg;
  cfg.host = getenv_or("DROPWAY_DB_HOST", "127.0.0.1");
  cfg.port = getenv_or("DROPWAY_DB_PORT", "5432");
  cfg.user = getenv_or("DROPWAY_DB_USER", "dropway");
  cfg.password = getenv_or("DROPWAY_DB_PASSWORD", "dropway");
  cfg.name = getenv_or("DROPWAY_DB_NAME", "dropway");
  return cfg;
}

bool db_configured() {
  return !getenv_or("DROPWAY_DB_HOST", "").empty();
}

} // namespace dropway::db
