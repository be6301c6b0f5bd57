#include "dropway/storage/chunk_store.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <system_error>

namespace dropway::storage {

namespace {

struct FileCloser {
  void operator()(FILE* f) const {
    if (f) std::fclose(f);
  }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

FilePtr open_or_throw(const std::string& path, const char* mode) {
  FILE* f = std::fopen(path.c_str(), mode);
  if (!f) {
    throw StorageError("open " + path + ": " + std::strerror(errno));
  }
  return FilePtr(f);
}

void seek_or_throw(FILE* f, uint64_t offset, const std::string& path) {
  if (fseeko(f, static_cast<off_t>(offset), SEEK_SET) != 0) {
    throw StorageError("seek " + path + ": " + std::strerror(errno));
  }
}

constexpr size_t kHashBuffer = 64 * 1024;

} // namespace

uint32_t FileDescriptor::chunk_length(uint32_t index) const {
  if (index >= chunk_count) throw ChunkOutOfRange("chunk index " + std::to_string(index) + " out of range");
  uint64_t off = chunk_offset(index);
  uint64_t left = size - off;
  return static_cast<uint32_t>(left < chunk_size ? left : chunk_size);
}

ChunkStore::ChunkStore(uint32_t chunk_size) : chunk_size_(chunk_size) {
  if (chunk_size_ == 0) throw std::invalid_argument("chunk size must be positive");
}

uint32_t ChunkStore::chunk_count_for(uint64_t size, uint32_t chunk_size) {
  uint64_t n = (size + chunk_size - 1) / chunk_size;
  if (n > 0xFFFFFFFFull) throw StorageError("file has too many chunks");
  return static_cast<uint32_t>(n);
}

FileDescriptor ChunkStore::describe(const std::string& path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw StorageError("not a regular file: " + path);
  }

  FileDescriptor desc;
  desc.name = std::filesystem::path(path).filename().string();
  desc.size = std::filesystem::file_size(path, ec);
  if (ec) throw StorageError("stat " + path + ": " + ec.message());
  desc.chunk_size = chunk_size_;
  desc.chunk_count = chunk_count_for(desc.size, chunk_size_);
  desc.chunk_hashes.reserve(desc.chunk_count);

  // one pass: whole-file hash and per-chunk hashes together
  FilePtr f = open_or_throw(path, "rb");
  crypto::Sha256 whole;
  std::vector<uint8_t> buf(chunk_size_);
  uint64_t total = 0;
  for (uint32_t i = 0; i < desc.chunk_count; i++) {
    uint32_t len = desc.chunk_length(i);
    size_t got = std::fread(buf.data(), 1, len, f.get());
    if (got != len) throw StorageError("short read on " + path + " (file changed while hashing?)");
    whole.update(buf.data(), len);
    desc.chunk_hashes.push_back(crypto::sha256(buf.data(), len));
    total += len;
  }
  if (total != desc.size) throw StorageError("size mismatch while hashing " + path);
  desc.hash = whole.finish();
  return desc;
}

Chunk ChunkStore::read_chunk(const std::string& path, const FileDescriptor& desc, uint32_t index) const {
  if (index >= desc.chunk_count) {
    throw ChunkOutOfRange("chunk index " + std::to_string(index) + " not in [0, " +
                          std::to_string(desc.chunk_count) + ")");
  }
  Chunk c;
  c.index = index;
  c.offset = desc.chunk_offset(index);
  c.data.resize(desc.chunk_length(index));

  FilePtr f = open_or_throw(path, "rb");
  seek_or_throw(f.get(), c.offset, path);
  size_t got = std::fread(c.data.data(), 1, c.data.size(), f.get());
  if (got != c.data.size()) throw StorageError("short read of chunk " + std::to_string(index) + " from " + path);
  c.hash = crypto::sha256(c.data.data(), c.data.size());
  return c;
}

bool ChunkStore::verify_chunk(const Chunk& chunk, const crypto::Digest& expected) {
  crypto::Digest actual = crypto::sha256(chunk.data.data(), chunk.data.size());
  // constant-time compare
  unsigned char diff = 0;
  for (size_t i = 0; i < actual.size(); i++) diff |= (actual[i] ^ expected[i]);
  return diff == 0;
}

void ChunkStore::preallocate(const std::string& target, uint64_t size) {
  std::error_code ec;
  auto parent = std::filesystem::path(target).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  if (!std::filesystem::exists(target, ec)) {
    FilePtr f = open_or_throw(target, "wb");
  }
  std::filesystem::resize_file(target, size, ec);
  if (ec) throw StorageError("resize " + target + ": " + ec.message());
}

void ChunkStore::write_chunk(const std::string& target, const Chunk& chunk) {
  FilePtr f = open_or_throw(target, "r+b");
  seek_or_throw(f.get(), chunk.offset, target);
  size_t written = std::fwrite(chunk.data.data(), 1, chunk.data.size(), f.get());
  if (written != chunk.data.size()) {
    throw StorageError("partial write of chunk " + std::to_string(chunk.index) + " to " + target);
  }
  if (std::fflush(f.get()) != 0) {
    throw StorageError("flush " + target + ": " + std::strerror(errno));
  }
  FILE* raw = f.release();
  if (std::fclose(raw) != 0) {
    throw StorageError("close " + target + ": " + std::strerror(errno));
  }
}

crypto::Digest ChunkStore::hash_file(const std::string& path) {
  FilePtr f = open_or_throw(path, "rb");
  crypto::Sha256 h;
  std::vector<uint8_t> buf(kHashBuffer);
  size_t got;
  while ((got = std::fread(buf.data(), 1, buf.size(), f.get())) > 0) {
    h.update(buf.data(), got);
  }
  if (std::ferror(f.get())) throw StorageError("read error while hashing " + path);
  return h.finish();
}

std::vector<Chunk> ChunkStore::split(const std::string& path, const FileDescriptor& desc) const {
  std::vector<Chunk> chunks;
  chunks.reserve(desc.chunk_count);
  for (uint32_t i = 0; i < desc.chunk_count; i++) {
    chunks.push_back(read_chunk(path, desc, i));
  }
  return chunks;
}

void ChunkStore::reassemble(const std::string& target, const FileDescriptor& desc, const std::vector<Chunk>& chunks) {
  if (chunks.size() != desc.chunk_count) {
    throw StorageError("reassemble " + target + ": " + std::to_string(chunks.size()) + " chunks for " +
                       std::to_string(desc.chunk_count));
  }
  std::vector<bool> seen(desc.chunk_count, false);
  for (const auto& c : chunks) {
    if (c.index >= desc.chunk_count) {
      throw ChunkOutOfRange("chunk index " + std::to_string(c.index) + " out of range");
    }
    if (seen[c.index]) throw StorageError("reassemble " + target + ": chunk " + std::to_string(c.index) + " twice");
    seen[c.index] = true;
    if (c.offset != desc.chunk_offset(c.index) || c.data.size() != desc.chunk_length(c.index) ||
        !verify_chunk(c, desc.chunk_hashes[c.index])) {
      throw StorageError("reassemble " + target + ": chunk " + std::to_string(c.index) + " does not match");
    }
  }

  preallocate(target, desc.size);
  for (const auto& c : chunks) write_chunk(target, c);
  if (hash_file(target) != desc.hash) throw StorageError("reassemble " + target + ": file hash mismatch");
}

} // namespace dropway::storage
