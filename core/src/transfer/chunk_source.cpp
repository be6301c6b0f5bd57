#include "dropway/transfer/chunk_source.h"
#include "dropway/protocol/transfer_messages.h"
#include <filesystem>

namespace dropway::transfer {

ChunkSource::ChunkSource(std::string path, storage::FileDescriptor desc)
  : path_(std::move(path)), desc_(std::move(desc)), store_(desc_.chunk_size == 0 ? 1 : desc_.chunk_size) {}

std::shared_ptr<ChunkSource> ChunkSource::open(const std::string& path, const storage::ChunkStore& store,
                                               const std::string& offered_name) {
  const std::string name =
      offered_name.empty() ? std::filesystem::path(path).filename().string() : offered_name;

  std::error_code ec;
  const uint64_t size = std::filesystem::file_size(path, ec);
  if (!ec) {
    const uint64_t chunks = (size + store.chunk_size() - 1) / store.chunk_size();
    const uint32_t limit = protocol::Offer::max_chunk_count(name.size());
    if (chunks > limit) {
      throw OfferTooLarge(path + " needs " + std::to_string(chunks) + " chunks of " +
                          std::to_string(store.chunk_size()) + " bytes; one offer carries at most " +
                          std::to_string(limit));
    }
  }

  auto desc = store.describe(path);
  desc.name = name;
  return std::make_shared<ChunkSource>(path, std::move(desc));
}

storage::Chunk ChunkSource::read_verified(uint32_t index) const {
  storage::Chunk c = store_.read_chunk(path_, desc_, index);
  if (!storage::ChunkStore::verify_chunk(c, desc_.chunk_hashes[index])) {
    throw storage::StorageError("chunk " + std::to_string(index) + " of " + path_ + " changed since it was offered");
  }
  return c;
}

} // namespace dropway::transfer
