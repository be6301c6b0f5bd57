#pragma once

#include "dropway/db/db.h"
#include "dropway/storage/resume_store.h"
#include <mutex>

namespace dropway::db {

// ResumeStore over the resume_state table:
//   peer_id TEXT, file_hash TEXT, file_name TEXT, target_path TEXT,
//   chunk_count INTEGER, confirmed TEXT ("0-19,21"), updated_at TIMESTAMPTZ
// primary key (peer_id, file_hash)
class PgResumeStore : public storage::ResumeStore {
 public:
  // Connects and creates the table when missing. Throws DbError.
  explicit PgResumeStore(DbConfig cfg);

  std::optional<storage::ResumeRecord> load(const std::string& peer_id, const std::string& file_hash_hex) override;
  void save(const storage::ResumeRecord& rec) override;
  void remove(const std::string& peer_id, const std::string& file_hash_hex) override;

 private:
  void ensure_schema();

  std::mutex mutex_;  // one PGconn, shared by io thread and disk pool
  Db db_;
};

} // namespace dropway::db
