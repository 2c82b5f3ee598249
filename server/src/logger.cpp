#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace vault::server {

namespace {
std::string now_string() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&now_c, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}
}

Logger::Logger(const std::string& file_path, bool mirror_to_clog)
    : file_path_(file_path), mirror_to_clog_(mirror_to_clog) {
    ensure_stream();
}

void Logger::ensure_stream() {
    if (stream_.is_open()) {
        return;
    }
    const auto parent = std::filesystem::path(file_path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    stream_.open(file_path_, std::ios::app);
    if (!stream_) {
        throw std::runtime_error("Failed to open log file: " + file_path_);
    }
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
        case LogLevel::kSecurity:
            return "SECURITY";
        default:
            return "INFO";
    }
}

std::size_t Logger::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    const auto handle = next_listener_++;
    listeners_.emplace_back(handle, std::move(listener));
    return handle;
}

void Logger::remove_listener(std::size_t handle) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [handle](const auto& entry) { return entry.first == handle; }),
                     listeners_.end());
}

void Logger::log(LogLevel level, std::string_view message) {
    const std::string stamp = now_string();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ensure_stream();
        stream_ << stamp << " [" << level_to_string(level) << "] " << message << '\n';
        stream_.flush();
        if (mirror_to_clog_) {
            std::clog << stamp << " [" << level_to_string(level) << "] " << message << '\n';
        }
    }

    // Listeners run without either lock held, so they may log themselves.
    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            snapshot.push_back(entry.second);
        }
    }
    for (const auto& listener : snapshot) {
        listener(level, message);
    }
}

}  // namespace vault::server
