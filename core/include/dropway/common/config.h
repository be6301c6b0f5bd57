#pragma once
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace dropway {

inline std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return (v && *v) ? std::string(v) : def;
}

struct Config {
    // Peer identity and reachability
    std::string peer_id;                  // empty: generate a fresh one at startup
    uint16_t listen_port = 0;             // 0: ephemeral
    std::vector<std::string> advertise;   // "host:port"; empty: loopback + bound port
    std::string relay;                    // "host:port" of a relay, optional

    std::string download_dir = "./downloads";
    std::string log_path = "./dropway.log";
    bool log_stderr = false;
    bool log_debug = false;

    // Transfer tuning
    uint32_t chunk_size = 256 * 1024;
    uint32_t window = 8;
    uint32_t chunk_retry_budget = 3;
    std::chrono::milliseconds chunk_timeout{10000};

    // Connection tuning
    std::chrono::milliseconds resolve_timeout{15000};
    std::chrono::milliseconds address_timeout{3000};
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds idle_timeout{60000};

    // Resumption
    uint32_t reconnect_attempts = 5;
    std::chrono::milliseconds reconnect_backoff{500};
    std::chrono::milliseconds resume_wait{30000};
    std::chrono::milliseconds offer_timeout{300000};

    // Web bridge
    uint16_t http_port = 0;
    std::string public_origin;

    bool auto_accept = false;
    std::size_t disk_threads = 2;
    std::size_t history_limit = 256;      // finished transfers kept for status() and late RESUMEs

    static Config from_env();
};

// Splits "a,b,c" and drops empty items.
std::vector<std::string> split_list(const std::string& s, char sep = ',');

} // namespace dropway
