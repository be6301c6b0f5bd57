#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dropway::storage {

// What a receiver needs to pick a transfer back up after a disconnect or restart.
struct ResumeRecord {
  std::string peer_id;
  std::string file_hash_hex;
  std::string file_name;
  std::string target_path;          // the .part file
  uint32_t chunk_count = 0;
  std::vector<uint32_t> confirmed;  // ascending
};

// Keyed by (peer id, file hash). Implementations are called from the disk pool
// and from the io thread, so they must be thread-safe.
class ResumeStore {
 public:
  virtual ~ResumeStore() = default;

  virtual std::optional<ResumeRecord> load(const std::string& peer_id, const std::string& file_hash_hex) = 0;
  virtual void save(const ResumeRecord& rec) = 0;
  virtual void remove(const std::string& peer_id, const std::string& file_hash_hex) = 0;
};

class MemoryResumeStore : public ResumeStore {
 public:
  std::optional<ResumeRecord> load(const std::string& peer_id, const std::string& file_hash_hex) override;
  void save(const ResumeRecord& rec) override;
  void remove(const std::string& peer_id, const std::string& file_hash_hex) override;

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, ResumeRecord> records_;
};

// "0-19,21,30-31" <-> {0..19, 21, 30, 31}
std::string format_ranges(const std::vector<uint32_t>& sorted);

// Throws std::invalid_argument on malformed text or an index >= limit.
std::vector<uint32_t> parse_ranges(const std::string& text, uint32_t limit);

} // namespace dropway::storage
