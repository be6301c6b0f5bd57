#include "dropway/common/config.h"
#include <sstream>
#include <stdexcept>

namespace dropway {

static std::chrono::milliseconds ms_or(const char* k, std::chrono::milliseconds def) {
    return std::chrono::milliseconds(std::stoll(getenv_or(k, std::to_string(def.count()))));
}

static bool flag_or(const char* k, bool def) {
    std::string v = getenv_or(k, def ? "1" : "0");
    return v == "1" || v == "true" || v == "yes";
}

std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, sep)) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

Config Config::from_env() {
    Config c;
    c.peer_id = getenv_or("DROPWAY_PEER_ID", "");
    c.listen_port = static_cast<uint16_t>(std::stoi(getenv_or("DROPWAY_PORT", "0")));
    c.advertise = split_list(getenv_or("DROPWAY_ADVERTISE", ""));
    c.relay = getenv_or("DROPWAY_RELAY", "");

    c.download_dir = getenv_or("DROPWAY_DOWNLOAD_DIR", c.download_dir);
    c.log_path = getenv_or("DROPWAY_LOG_PATH", c.log_path);
    c.log_stderr = flag_or("DROPWAY_LOG_STDERR", false);
    c.log_debug = flag_or("DROPWAY_LOG_DEBUG", false);

    c.chunk_size = static_cast<uint32_t>(std::stoul(getenv_or("DROPWAY_CHUNK_SIZE", std::to_string(c.chunk_size))));
    c.window = static_cast<uint32_t>(std::stoul(getenv_or("DROPWAY_WINDOW", std::to_string(c.window))));
    c.chunk_retry_budget =
        static_cast<uint32_t>(std::stoul(getenv_or("DROPWAY_CHUNK_RETRIES", std::to_string(c.chunk_retry_budget))));
    c.chunk_timeout = ms_or("DROPWAY_CHUNK_TIMEOUT_MS", c.chunk_timeout);

    c.resolve_timeout = ms_or("DROPWAY_RESOLVE_TIMEOUT_MS", c.resolve_timeout);
    c.address_timeout = ms_or("DROPWAY_ADDRESS_TIMEOUT_MS", c.address_timeout);
    c.handshake_timeout = ms_or("DROPWAY_HANDSHAKE_TIMEOUT_MS", c.handshake_timeout);
    c.idle_timeout = ms_or("DROPWAY_IDLE_TIMEOUT_MS", c.idle_timeout);

    c.reconnect_attempts =
        static_cast<uint32_t>(std::stoul(getenv_or("DROPWAY_RECONNECT_ATTEMPTS", std::to_string(c.reconnect_attempts))));
    c.reconnect_backoff = ms_or("DROPWAY_RECONNECT_BACKOFF_MS", c.reconnect_backoff);
    c.resume_wait = ms_or("DROPWAY_RESUME_WAIT_MS", c.resume_wait);
    c.offer_timeout = ms_or("DROPWAY_OFFER_TIMEOUT_MS", c.offer_timeout);

    c.http_port = static_cast<uint16_t>(std::stoi(getenv_or("DROPWAY_HTTP_PORT", "0")));
    c.public_origin = getenv_or("DROPWAY_PUBLIC_ORIGIN", "");

    c.auto_accept = flag_or("DROPWAY_AUTO_ACCEPT", false);
    c.disk_threads = static_cast<std::size_t>(std::stoul(getenv_or("DROPWAY_DISK_THREADS", "2")));
    c.history_limit =
        static_cast<std::size_t>(std::stoul(getenv_or("DROPWAY_HISTORY", std::to_string(c.history_limit))));

    if (c.chunk_size == 0 || c.chunk_size > 8 * 1024 * 1024) {
        throw std::invalid_argument("DROPWAY_CHUNK_SIZE must be in (0, 8 MiB]");
    }
    if (c.window == 0) throw std::invalid_argument("DROPWAY_WINDOW must be positive");
    if (c.disk_threads == 0) c.disk_threads = 1;
    if (c.history_limit == 0) c.history_limit = 1;
    return c;
}

} // namespace dropway
