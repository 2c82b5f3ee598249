#pragma once

#include <cstddef>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

enum class LogLevel {
    kInfo,
    kWarn,
    kError,
    kSecurity,
};

namespace vault::server {

class Logger {
public:
    using Listener = std::function<void(LogLevel level, std::string_view message)>;

    explicit Logger(const std::string& file_path, bool mirror_to_clog = true);
    void log(LogLevel level, std::string_view message);

    void info(std::string_view message) { log(LogLevel::kInfo, message); }
    void warn(std::string_view message) { log(LogLevel::kWarn, message); }
    void error(std::string_view message) { log(LogLevel::kError, message); }
    // Security-relevant events (traversal attempts, cross-user session access) for monitoring.
    void security(std::string_view message) { log(LogLevel::kSecurity, message); }

    std::size_t add_listener(Listener listener);
    void remove_listener(std::size_t handle);

    static std::string_view level_to_string(LogLevel level);

private:
    void ensure_stream();

    std::mutex mutex_;
    std::ofstream stream_;
    std::string file_path_;
    bool mirror_to_clog_;

    std::mutex listener_mutex_;
    std::size_t next_listener_ = 1;
    std::vector<std::pair<std::size_t, Listener>> listeners_;
};

}  // namespace vault::server
