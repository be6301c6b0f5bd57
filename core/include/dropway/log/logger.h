#pragma once
#include <mutex>
#include <string>

namespace dropway {

class Logger {
public:
    static Logger& instance();

    // Appends to `path`; an empty path disables the file sink.
    void init(const std::string& path, bool echo_stderr = false, bool debug = false);
    void set_debug(bool enabled);

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

private:
    Logger() = default;
    void write(const char* level, const std::string& msg);

    std::mutex mu_;
    std::string path_;
    bool echo_stderr_ = false;
    bool debug_ = false;
};

} // namespace dropway
