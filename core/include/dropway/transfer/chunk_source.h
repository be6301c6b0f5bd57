#pragma once

#include "dropway/storage/chunk_store.h"
#include <memory>
#include <stdexcept>
#include <string>

namespace dropway::transfer {

// The file needs more chunk hashes than one OFFER frame can carry.
class OfferTooLarge : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Sender-side view of one offered file. Shared by push/pull sessions and the web bridge.
class ChunkSource {
 public:
  ChunkSource(std::string path, storage::FileDescriptor desc);

  // describe() on the file; blocking, run it on the disk pool. `offered_name`
  // replaces the file's own name in the descriptor when set. Throws
  // OfferTooLarge before hashing when the chunk list cannot be offered, and
  // StorageError when the file cannot be read.
  static std::shared_ptr<ChunkSource> open(const std::string& path, const storage::ChunkStore& store,
                                           const std::string& offered_name = "");

  const std::string& path() const { return path_; }
  const storage::FileDescriptor& descriptor() const { return desc_; }

  // Reads chunk `index` and checks it against the descriptor.
  // Throws ChunkOutOfRange, or StorageError when the file changed since describe().
  storage::Chunk read_verified(uint32_t index) const;

 private:
  std::string path_;
  storage::FileDescriptor desc_;
  storage::ChunkStore store_;
};

} // namespace dropway::transfer
