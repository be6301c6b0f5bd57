#pragma once

#include "dropway/crypto/digest.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace dropway::storage {

class ChunkOutOfRange : public std::out_of_range {
 public:
  using std::out_of_range::out_of_range;
};

class StorageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct FileDescriptor {
  std::string name;
  uint64_t size = 0;
  crypto::Digest hash{};
  uint32_t chunk_size = 0;
  uint32_t chunk_count = 0;
  std::vector<crypto::Digest> chunk_hashes;

  uint64_t chunk_offset(uint32_t index) const { return uint64_t(index) * chunk_size; }
  uint32_t chunk_length(uint32_t index) const;
  std::string hash_hex() const { return crypto::to_hex(hash); }
};

struct Chunk {
  uint32_t index = 0;
  uint64_t offset = 0;
  crypto::Digest hash{};
  std::vector<uint8_t> data;
};

// Fixed-size chunking, verification and positional reassembly.
// Stateless apart from the chunk size; every call opens and closes its files.
class ChunkStore {
 public:
  explicit ChunkStore(uint32_t chunk_size);

  uint32_t chunk_size() const { return chunk_size_; }

  FileDescriptor describe(const std::string& path) const;

  // index must be in [0, desc.chunk_count), otherwise ChunkOutOfRange
  Chunk read_chunk(const std::string& path, const FileDescriptor& desc, uint32_t index) const;

  static bool verify_chunk(const Chunk& chunk, const crypto::Digest& expected);

  // Creates `target` if needed and sizes it to `size`; existing bytes are kept.
  static void preallocate(const std::string& target, uint64_t size);

  // Writes at chunk.offset; the target must already be preallocated.
  static void write_chunk(const std::string& target, const Chunk& chunk);

  static crypto::Digest hash_file(const std::string& path);

  // Every chunk of `path` in index order. Holds the whole file in memory.
  std::vector<Chunk> split(const std::string& path, const FileDescriptor& desc) const;

  // Writes `chunks` (any order, each index exactly once) into `target` and
  // checks the result against desc.hash. Throws StorageError or ChunkOutOfRange.
  static void reassemble(const std::string& target, const FileDescriptor& desc, const std::vector<Chunk>& chunks);

  static uint32_t chunk_count_for(uint64_t size, uint32_t chunk_size);

 private:
  uint32_t chunk_size_;
};

} // namespace dropway::storage
