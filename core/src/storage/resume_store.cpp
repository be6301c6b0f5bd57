#include "dropway/storage/resume_store.h"
#include <sstream>
#include <stdexcept>

namespace dropway::storage {

std::optional<ResumeRecord> MemoryResumeStore::load(const std::string& peer_id, const std::string& file_hash_hex) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find({peer_id, file_hash_hex});
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

void MemoryResumeStore::save(const ResumeRecord& rec) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[{rec.peer_id, rec.file_hash_hex}] = rec;
}

void MemoryResumeStore::remove(const std::string& peer_id, const std::string& file_hash_hex) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.erase({peer_id, file_hash_hex});
}

size_t MemoryResumeStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::string format_ranges(const std::vector<uint32_t>& sorted) {
  std::ostringstream out;
  size_t i = 0;
  bool first = true;
  while (i < sorted.size()) {
    size_t j = i;
    while (j + 1 < sorted.size() && sorted[j + 1] == sorted[j] + 1) j++;
    if (!first) out << ',';
    first = false;
    out << sorted[i];
    if (j > i) out << '-' << sorted[j];
    i = j + 1;
  }
  return out.str();
}

std::vector<uint32_t> parse_ranges(const std::string& text, uint32_t limit) {
  std::vector<uint32_t> out;
  std::stringstream ss(text);
  std::string item;
  uint64_t floor = 0;
  while (std::getline(ss, item, ',')) {
    if (item.empty()) throw std::invalid_argument("ranges: empty item");
    auto dash = item.find('-');
    uint64_t a, b;
    size_t used = 0;
    if (dash == std::string::npos) {
      a = b = std::stoull(item, &used);
      if (used != item.size()) throw std::invalid_argument("ranges: bad number '" + item + "'");
    } else {
      std::string lo = item.substr(0, dash), hi = item.substr(dash + 1);
      a = std::stoull(lo, &used);
      if (used != lo.size()) throw std::invalid_argument("ranges: bad number '" + lo + "'");
      b = std::stoull(hi, &used);
      if (used != hi.size()) throw std::invalid_argument("ranges: bad number '" + hi + "'");
    }
    if (b < a || a < floor || b >= limit) throw std::invalid_argument("ranges: bad run '" + item + "'");
    for (uint64_t k = a; k <= b; k++) out.push_back(static_cast<uint32_t>(k));
    floor = b + 1;
  }
  return out;
}

} // namespace dropway::storage
