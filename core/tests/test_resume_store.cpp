#include "test_util.h"

#include "dropway/crypto/digest.h"
#include "dropway/db/resume_repository.h"
#include "dropway/storage/resume_store.h"

#include <stdexcept>

using dropway::storage::MemoryResumeStore;
using dropway::storage::ResumeRecord;
using dropway::storage::ResumeStore;

static bool rejects(const std::string& text, uint32_t limit) {
    try {
        dropway::storage::parse_ranges(text, limit);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static bool test_ranges() {
    using dropway::storage::format_ranges;
    using dropway::storage::parse_ranges;

    std::vector<uint32_t> v;
    for (uint32_t i = 0; i < 20; i++) v.push_back(i);
    v.push_back(21);
    v.push_back(30);
    v.push_back(31);
    TEST_ASSERT(format_ranges(v) == "0-19,21,30-31", "format runs");
    TEST_ASSERT(parse_ranges("0-19,21,30-31", 32) == v, "parse runs");
    TEST_ASSERT(format_ranges({}).empty() && parse_ranges("", 10).empty(), "empty set");

    TEST_ASSERT(rejects("0-32", 32), "index at limit");
    TEST_ASSERT(rejects("5-3", 32), "descending run");
    TEST_ASSERT(rejects("4,2", 32), "out of order");
    TEST_ASSERT(rejects("1,,2", 32), "empty item");
    TEST_ASSERT(rejects("x", 32), "not a number");
    TEST_ASSERT(rejects("3x", 32), "trailing junk");
    return true;
}

static ResumeRecord sample_record(const std::string& peer) {
    ResumeRecord r;
    r.peer_id = peer;
    r.file_hash_hex = dropway::crypto::random_hex(32);
    r.file_name = "movie.mkv";
    r.target_path = "/tmp/movie.mkv." + r.file_hash_hex.substr(0, 8) + ".part";
    r.chunk_count = 40;
    for (uint32_t i = 0; i < 20; i++) r.confirmed.push_back(i);
    r.confirmed.push_back(25);
    return r;
}

static bool exercise_store(ResumeStore& store, const std::string& label) {
    const std::string peer = dropway::crypto::generate_peer_id();
    ResumeRecord rec = sample_record(peer);

    TEST_ASSERT(!store.load(peer, rec.file_hash_hex), label << ": nothing stored yet");
    store.save(rec);
    auto back = store.load(peer, rec.file_hash_hex);
    TEST_ASSERT(back.has_value(), label << ": saved record loads");
    TEST_ASSERT(back->confirmed == rec.confirmed, label << ": confirmed set");
    TEST_ASSERT(back->file_name == rec.file_name && back->target_path == rec.target_path, label << ": names");
    TEST_ASSERT(back->chunk_count == 40, label << ": chunk count");

    TEST_ASSERT(!store.load(dropway::crypto::generate_peer_id(), rec.file_hash_hex),
                label << ": keyed by peer as well as hash");

    rec.confirmed.push_back(26);
    store.save(rec);
    back = store.load(peer, rec.file_hash_hex);
    TEST_ASSERT(back && back->confirmed.size() == 22, label << ": save replaces");

    store.remove(peer, rec.file_hash_hex);
    TEST_ASSERT(!store.load(peer, rec.file_hash_hex), label << ": removed");
    store.remove(peer, rec.file_hash_hex);
    return true;
}

static bool test_memory_store() {
    MemoryResumeStore store;
    if (!exercise_store(store, "memory")) return false;
    TEST_ASSERT(store.size() == 0, "memory store empty after remove");
    return true;
}

static bool test_pg_store() {
    if (!dropway::db::db_configured()) {
        std::cout << "SKIP: postgres resume store (DROPWAY_DB_HOST not set)" << std::endl;
        return true;
    }
    dropway::db::PgResumeStore store(dropway::db::load_db_config_from_env());
    if (!exercise_store(store, "postgres")) return false;

    // a row written by something else with a chunk list that does not parse
    dropway::db::Db db(dropway::db::load_db_config_from_env());
    db.connect();
    const std::string peer = dropway::crypto::generate_peer_id();
    const std::string hash = dropway::crypto::random_hex(32);
    TEST_ASSERT(db.command("insert bad row",
                           "INSERT INTO resume_state(peer_id, file_hash, file_name, target_path, chunk_count, confirmed) "
                           "VALUES ($1, $2, 'x.bin', '/tmp/x.part', 8, '5-3')",
                           {peer, hash}) == 1,
                "bad row inserted");
    TEST_ASSERT(!store.load(peer, hash), "unreadable row is not a record");
    auto left = db.query("count rows", "SELECT count(*) FROM resume_state WHERE peer_id = $1", {peer});
    TEST_ASSERT(left.rows() == 1 && left.u32(0, 0) == 0, "unreadable row dropped");

    bool threw = false;
    try {
        left.text(0, 3);
    } catch (const dropway::db::DbError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "missing column reported");
    return true;
}

int main() {
    std::cout << "--- Resume store tests ---" << std::endl;
    RUN_TEST(test_ranges(), "confirmed set text form");
    RUN_TEST(test_memory_store(), "memory resume store");
    try {
        RUN_TEST(test_pg_store(), "postgres resume store");
    } catch (const dropway::db::DbError& e) {
        std::cerr << "FAIL: postgres resume store: " << e.what() << std::endl;
        tests_failed++;
    }
    return finish_tests();
}
