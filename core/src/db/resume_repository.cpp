#include "dropway/db/resume_repository.h"
#include "dropway/log/logger.h"

namespace dropway::db {

namespace {

const char* kSelectColumns = "file_name, target_path, chunk_count, confirmed";

// Columns in kSelectColumns order; the key comes from the lookup.
storage::ResumeRecord record_from_row(const Result& r, int row, const std::string& peer_id,
                                      const std::string& file_hash_hex) {
  storage::ResumeRecord rec;
  rec.peer_id = peer_id;
  rec.file_hash_hex = file_hash_hex;
  rec.file_name = r.text(row, 0);
  rec.target_path = r.text(row, 1);
  rec.chunk_count = r.u32(row, 2);
  rec.confirmed = storage::parse_ranges(r.text(row, 3), rec.chunk_count);
  return rec;
}

std::vector<std::string> record_params(const storage::ResumeRecord& rec) {
  return {rec.peer_id, rec.file_hash_hex, rec.file_name, rec.target_path,
          std::to_string(rec.chunk_count), storage::format_ranges(rec.confirmed)};
}

} // namespace

PgResumeStore::PgResumeStore(DbConfig cfg) : db_(std::move(cfg)) {
  db_.connect();
  ensure_schema();
}

void PgResumeStore::ensure_schema() {
  db_.command("create resume_state",
              "CREATE TABLE IF NOT EXISTS resume_state ("
              "  peer_id TEXT NOT NULL,"
              "  file_hash TEXT NOT NULL,"
              "  file_name TEXT NOT NULL,"
              "  target_path TEXT NOT NULL,"
              "  chunk_count INTEGER NOT NULL CHECK (chunk_count >= 0),"
              "  confirmed TEXT NOT NULL DEFAULT '',"
              "  updated_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
              "  PRIMARY KEY (peer_id, file_hash)"
              ")");
}

std::optional<storage::ResumeRecord> PgResumeStore::load(const std::string& peer_id,
                                                          const std::string& file_hash_hex) {
  std::lock_guard<std::mutex> lock(mutex_);
  Result r = db_.query("load resume state",
                       std::string("SELECT ") + kSelectColumns +
                           " FROM resume_state WHERE peer_id = $1 AND file_hash = $2",
                       {peer_id, file_hash_hex});
  if (r.empty()) return std::nullopt;

  try {
    return record_from_row(r, 0, peer_id, file_hash_hex);
  } catch (const DbError& e) {
    Logger::instance().warn("[resume] dropping unreadable row for " + file_hash_hex + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    Logger::instance().warn("[resume] dropping row for " + file_hash_hex + " with bad chunk list: " + e.what());
  }
  db_.command("drop unreadable resume state", "DELETE FROM resume_state WHERE peer_id = $1 AND file_hash = $2",
              {peer_id, file_hash_hex});
  return std::nullopt;
}

void PgResumeStore::save(const storage::ResumeRecord& rec) {
  std::lock_guard<std::mutex> lock(mutex_);
  db_.command("save resume state",
              "INSERT INTO resume_state(peer_id, file_hash, file_name, target_path, chunk_count, confirmed) "
              "VALUES ($1, $2, $3, $4, $5, $6) "
              "ON CONFLICT (peer_id, file_hash) DO UPDATE SET "
              "file_name = EXCLUDED.file_name, target_path = EXCLUDED.target_path, "
              "chunk_count = EXCLUDED.chunk_count, confirmed = EXCLUDED.confirmed, updated_at = now()",
              record_params(rec));
}

void PgResumeStore::remove(const std::string& peer_id, const std::string& file_hash_hex) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t n = db_.command("remove resume state", "DELETE FROM resume_state WHERE peer_id = $1 AND file_hash = $2",
                           {peer_id, file_hash_hex});
  if (n == 0) Logger::instance().debug("[resume] no stored state for " + file_hash_hex);
}

} // namespace dropway::db
