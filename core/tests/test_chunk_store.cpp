#include "test_util.h"

#include "dropway/storage/chunk_store.h"
#include "dropway/storage/file_store.h"
#include "dropway/transfer/chunk_source.h"

#include <algorithm>
#include <random>

using dropway::storage::Chunk;
using dropway::storage::ChunkOutOfRange;
using dropway::storage::ChunkStore;
using dropway::storage::FileStore;
using dropway::storage::StorageError;

// chunk(F, C) handed back in shuffled order reproduces F
static bool test_reassemble(const std::filesystem::path& dir, size_t size, uint32_t chunk_size) {
    const auto src = dir / ("src_" + std::to_string(size) + "_" + std::to_string(chunk_size));
    const auto dst = dir / ("dst_" + std::to_string(size) + "_" + std::to_string(chunk_size));
    TEST_ASSERT(write_random_file(src, size, static_cast<uint32_t>(size + chunk_size)), "write source");

    ChunkStore store(chunk_size);
    auto desc = store.describe(src.string());
    TEST_ASSERT(desc.size == size, "size");
    TEST_ASSERT(desc.chunk_count == (size + chunk_size - 1) / chunk_size, "chunk count");
    TEST_ASSERT(desc.chunk_hashes.size() == desc.chunk_count, "one hash per chunk");

    auto chunks = store.split(src.string(), desc);
    TEST_ASSERT(chunks.size() == desc.chunk_count, "split yields every chunk");
    for (const auto& c : chunks) {
        TEST_ASSERT(ChunkStore::verify_chunk(c, desc.chunk_hashes[c.index]), "chunk " << c.index << " verifies");
        TEST_ASSERT(c.offset == uint64_t(c.index) * chunk_size, "offset");
    }
    std::shuffle(chunks.begin(), chunks.end(), std::mt19937(7));

    ChunkStore::reassemble(dst.string(), desc, chunks);
    TEST_ASSERT(ChunkStore::hash_file(dst.string()) == desc.hash, "reassembled hash matches");
    TEST_ASSERT(read_all_bytes(src) == read_all_bytes(dst), "reassembled bytes match");
    return true;
}

static bool test_reassemble_rejects(const std::filesystem::path& dir) {
    const auto src = dir / "reassemble_bad.bin";
    const auto dst = dir / "reassemble_bad.out";
    TEST_ASSERT(write_random_file(src, 3000, 5), "write source");
    ChunkStore store(1024);
    auto desc = store.describe(src.string());
    const auto good = store.split(src.string(), desc);

    auto throws_storage = [&](const std::vector<Chunk>& chunks) {
        try {
            ChunkStore::reassemble(dst.string(), desc, chunks);
        } catch (const StorageError&) {
            return true;
        }
        return false;
    };

    auto missing = good;
    missing.pop_back();
    TEST_ASSERT(throws_storage(missing), "missing chunk");

    auto twice = good;
    twice[2] = twice[0];
    TEST_ASSERT(throws_storage(twice), "duplicate chunk");

    auto corrupt = good;
    corrupt[1].data[7] ^= 0x40;
    TEST_ASSERT(throws_storage(corrupt), "corrupt chunk");

    auto stray = good;
    stray[0].index = 3;
    bool out_of_range = false;
    try {
        ChunkStore::reassemble(dst.string(), desc, stray);
    } catch (const ChunkOutOfRange&) {
        out_of_range = true;
    }
    TEST_ASSERT(out_of_range, "index past the last chunk");
    return true;
}

static bool test_last_chunk_and_bounds(const std::filesystem::path& dir) {
    const auto src = dir / "bounds.bin";
    TEST_ASSERT(write_random_file(src, 1000, 3), "write source");
    ChunkStore store(256);
    auto desc = store.describe(src.string());
    TEST_ASSERT(desc.chunk_count == 4, "1000 bytes / 256 = 4 chunks");
    TEST_ASSERT(desc.chunk_length(3) == 1000 - 768, "short final chunk");

    bool threw = false;
    try {
        store.read_chunk(src.string(), desc, 4);
    } catch (const ChunkOutOfRange&) {
        threw = true;
    }
    TEST_ASSERT(threw, "index == chunk_count is out of range");
    return true;
}

static bool test_empty_file(const std::filesystem::path& dir) {
    const auto src = dir / "empty.bin";
    { std::ofstream out(src, std::ios::binary); }
    ChunkStore store(1024);
    auto desc = store.describe(src.string());
    TEST_ASSERT(desc.size == 0 && desc.chunk_count == 0, "empty file has no chunks");
    TEST_ASSERT(desc.hash == dropway::crypto::sha256(nullptr, 0), "hash of empty input");

    const auto dst = dir / "empty.out";
    ChunkStore::reassemble(dst.string(), desc, store.split(src.string(), desc));
    TEST_ASSERT(std::filesystem::exists(dst) && std::filesystem::file_size(dst) == 0, "empty file reassembles");
    return true;
}

static bool test_corruption_detected(const std::filesystem::path& dir) {
    const auto src = dir / "corrupt.bin";
    TEST_ASSERT(write_random_file(src, 4096, 11), "write source");
    ChunkStore store(1024);
    auto desc = store.describe(src.string());

    Chunk c = store.read_chunk(src.string(), desc, 2);
    c.data[100] ^= 0x01;
    TEST_ASSERT(!ChunkStore::verify_chunk(c, desc.chunk_hashes[2]), "flipped bit is caught");

    // a changed source is caught on read
    auto source = std::make_shared<dropway::transfer::ChunkSource>(src.string(), desc);
    {
        std::fstream f(src, std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(1024 + 5);
        f.put('\x5a');
        f.put('\xa5');
    }
    bool threw = false;
    try {
        source->read_verified(1);
    } catch (const StorageError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "read_verified refuses a chunk that changed since describe");
    return true;
}

static bool test_file_store(const std::filesystem::path& dir) {
    FileStore files((dir / "downloads").string());
    TEST_ASSERT(files.initialize(), "create download dir");

    TEST_ASSERT(FileStore::safe_file_name("report.pdf").has_value(), "plain name");
    TEST_ASSERT(!FileStore::safe_file_name("../etc/passwd"), "path traversal");
    TEST_ASSERT(!FileStore::safe_file_name("a/b"), "slash");
    TEST_ASSERT(!FileStore::safe_file_name(".."), "dot dot");
    TEST_ASSERT(!FileStore::safe_file_name(""), "empty");

    TEST_ASSERT(FileStore::safe_relative_path("album/disc2/track.ogg").has_value(), "nested name");
    TEST_ASSERT(FileStore::safe_relative_path("report.pdf").has_value(), "single component");
    TEST_ASSERT(!FileStore::safe_relative_path("album/../../etc/passwd"), "dot dot component");
    TEST_ASSERT(!FileStore::safe_relative_path("/etc/passwd"), "absolute");
    TEST_ASSERT(!FileStore::safe_relative_path("album//track.ogg"), "empty component");
    TEST_ASSERT(!FileStore::safe_relative_path("album/"), "trailing slash");

    const std::string hash = std::string(64, 'a');
    const std::string part = files.get_temp_path("x.bin", hash);
    TEST_ASSERT(part == files.base_path() + "/x.bin.aaaaaaaa.part", "temp path layout");

    ChunkStore::preallocate(part, 10);
    TEST_ASSERT(!files.final_exists("x.bin"), "not final yet");
    const std::string final_path = files.finalize_file(part, "x.bin");
    TEST_ASSERT(files.final_exists("x.bin"), "final exists");
    TEST_ASSERT(!std::filesystem::exists(part), ".part renamed");
    TEST_ASSERT(final_path == files.get_file_path("x.bin"), "final path");

    ChunkStore::preallocate(part, 10);
    bool threw = false;
    try {
        files.finalize_file(part, "x.bin");
    } catch (const StorageError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "finalize never overwrites an existing file");
    TEST_ASSERT(files.cleanup(part), "cleanup removes the .part");
    TEST_ASSERT(files.free_space().has_value(), "free space query");

    const std::string nested_part = files.get_temp_path("album/disc2/track.ogg", hash);
    ChunkStore::preallocate(nested_part, 10);
    const std::string nested = files.finalize_file(nested_part, "album/disc2/track.ogg");
    TEST_ASSERT(nested == files.base_path() + "/album/disc2/track.ogg", "nested final path");
    TEST_ASSERT(std::filesystem::file_size(nested) == 10, "nested file in place");
    return true;
}

int main() {
    const auto dir = make_workdir("chunk_store_tests");
    init_test_logging(dir);
    std::cout << "--- ChunkStore tests (" << dir << ") ---" << std::endl;

    bool ok = true;
    // 257 / 256 and 4097 / 4096 end in a one-byte chunk
    for (size_t size : {1ul, 255ul, 256ul, 257ul, 4097ul, 100000ul}) {
        for (uint32_t cs : {1u, 256u, 4096u}) {
            if (size / cs > 20000) continue;
            ok = test_reassemble(dir, size, cs) && ok;
        }
    }
    if (ok) std::cout << "PASS: reassemble(chunk(F, C)) == F" << std::endl;

    RUN_TEST(test_reassemble_rejects(dir), "reassemble refuses incomplete or bad chunk sets");
    RUN_TEST(test_last_chunk_and_bounds(dir), "final chunk and bounds");
    RUN_TEST(test_empty_file(dir), "empty file");
    RUN_TEST(test_corruption_detected(dir), "corruption detected");
    RUN_TEST(test_file_store(dir), "download directory layout");
    return finish_tests();
}
