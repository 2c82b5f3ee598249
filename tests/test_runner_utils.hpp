#pragma once

#include "logger.hpp"
#include "storage_error.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace vault::test {

// Scratch directory under the system temp dir, wiped on construction and destruction.
class Workspace {
public:
    explicit Workspace(const std::string& name)
        : root_(std::filesystem::temp_directory_path() / ("vault_" + name)) {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        std::filesystem::create_directories(root_);
    }

    ~Workspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

class LogCapture {
public:
    LogCapture() = default;

    ~LogCapture() {
        detach();
    }

    void attach(server::Logger& logger) {
        detach();
        logger_ = &logger;
        handle_ = logger.add_listener([this](LogLevel level, std::string_view message) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(std::string(server::Logger::level_to_string(level)) + ": " + std::string(message));
            cv_.notify_all();
        });
    }

    void detach() {
        if (logger_ && handle_ != 0) {
            logger_->remove_listener(handle_);
        }
        logger_ = nullptr;
        handle_ = 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

    std::vector<std::string> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(lines_.begin(), lines_.end(),
                           [&](const std::string& line) { return line.find(needle) != std::string::npos; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> lines_;
    server::Logger* logger_ = nullptr;
    std::size_t handle_ = 0;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(interval);
    }
    return predicate();
}

inline std::vector<std::byte> bytes(std::string_view text) {
    return std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                  reinterpret_cast<const std::byte*>(text.data() + text.size()));
}

inline std::string text(std::span<const std::byte> data) {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, std::string_view content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    stream.write(content.data(), static_cast<std::streamsize>(content.size()));
}

template <typename R>
bool failed_with(const R& result, server::StorageErrc code) {
    return !result.ok() && result.code() == code;
}

template <typename Context>
struct TestCase {
    const char* name;
    std::function<bool(Context&)> fn;
};

// Runs every case against a freshly constructed Context, printing '.' or 'F'. Captured log
// lines are shown only for failing cases.
template <typename Context>
int run_tests(const std::string& suite, const std::vector<TestCase<Context>>& tests) {
    std::size_t failures = 0;
    std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

    for (std::size_t idx = 0; idx < tests.size(); ++idx) {
        const auto& test = tests[idx];
        bool passed = false;
        std::vector<std::string> lines;
        try {
            auto ctx = std::make_unique<Context>();
            passed = test.fn(*ctx);
            lines = ctx->logs.snapshot();
        } catch (const std::exception& e) {
            passed = false;
            std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
        }
        if (passed) {
            std::cout << '.' << std::flush;
        } else {
            std::cout << 'F' << " (" << test.name << ")\n";
            failures++;
            for (const auto& line : lines) {
                std::cout << "    " << line << "\n";
            }
            if (idx + 1 < tests.size()) {
                std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
            }
        }
    }
    std::cout << "\n";
    if (failures == 0) {
        std::cout << "PASS (" << tests.size() << " tests)\n";
        return 0;
    }
    std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
    return 1;
}

inline bool show_logs() {
    return std::getenv("VAULT_TEST_LOGS") != nullptr;
}

}  // namespace vault::test
