#include "dropway/log/logger.h"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace dropway {

static std::string now_iso() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    auto t = system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return os.str();
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const std::string& path, bool echo_stderr, bool debug) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        path_ = path;
        echo_stderr_ = echo_stderr;
        debug_ = debug;
    }
    write("INFO", "logger initialized");
}

void Logger::set_debug(bool enabled) {
    std::lock_guard<std::mutex> lk(mu_);
    debug_ = enabled;
}

void Logger::write(const char* level, const std::string& msg) {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream line;
    line << now_iso() << " [" << level << "] " << msg << "\n";
    if (!path_.empty()) {
        std::ofstream f(path_, std::ios::app);
        f << line.str();
    }
    if (echo_stderr_) {
        std::cerr << line.str();
        std::cerr.flush();
    }
}

void Logger::debug(const std::string& msg) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!debug_) return;
    }
    write("DEBUG", msg);
}

void Logger::info(const std::string& msg) { write("INFO", msg); }
void Logger::warn(const std::string& msg) { write("WARN", msg); }
void Logger::error(const std::string& msg) { write("ERROR", msg); }

} // namespace dropway
