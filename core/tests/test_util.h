#pragma once

#include "dropway/common/config.h"
#include "dropway/log/logger.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(fn, name) \
    do { \
        if (fn) std::cout << "PASS: " << name << std::endl; \
    } while (0)

static inline int finish_tests() {
    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}

static inline std::filesystem::path make_workdir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("dropway_" + name);
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    return dir;
}

static inline std::vector<uint8_t> read_all_bytes(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) return {};
    in.seekg(0, std::ios::end);
    const auto n = static_cast<size_t>(in.tellg());
    in.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(n);
    if (n > 0) in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(n));
    return data;
}

static inline bool write_random_file(const std::filesystem::path& p, size_t bytes, uint32_t seed) {
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) return false;

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);

    std::vector<uint8_t> buf(64 * 1024);
    size_t remaining = bytes;
    while (remaining > 0) {
        const size_t chunk = std::min(remaining, buf.size());
        for (size_t i = 0; i < chunk; i++) {
            buf[i] = static_cast<uint8_t>(dist(rng));
        }
        out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(chunk));
        remaining -= chunk;
    }
    out.flush();
    return static_cast<bool>(out);
}

template <typename Pred>
static bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// Loopback node settings with short timeouts.
static inline dropway::Config test_config(const std::filesystem::path& dir) {
    dropway::Config c;
    c.listen_port = 0;
    c.download_dir = (dir / "downloads").string();
    c.log_path = "";
    c.chunk_size = 256 * 1024;
    c.window = 8;
    c.chunk_retry_budget = 3;
    c.chunk_timeout = std::chrono::milliseconds(3000);
    c.resolve_timeout = std::chrono::milliseconds(4000);
    c.address_timeout = std::chrono::milliseconds(1000);
    c.handshake_timeout = std::chrono::milliseconds(2000);
    c.idle_timeout = std::chrono::milliseconds(10000);
    c.reconnect_attempts = 5;
    c.reconnect_backoff = std::chrono::milliseconds(100);
    c.resume_wait = std::chrono::milliseconds(5000);
    c.offer_timeout = std::chrono::milliseconds(5000);
    c.auto_accept = true;
    c.disk_threads = 2;
    return c;
}

static inline void init_test_logging(const std::filesystem::path& dir) {
    dropway::Logger::instance().init((dir / "test.log").string(), false, true);
}
