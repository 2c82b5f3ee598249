#pragma once

#include "logger.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace vault::server {

// Fixed pool for work that must not run on the reactor thread (upload assembly, batch writes).
class TaskExecutor {
public:
    explicit TaskExecutor(Logger& logger);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    void start(std::size_t worker_count);
    // `label` names the task in the log if it throws.
    void submit(std::string label, std::function<void()> task);
    // Runs every queued task, then joins the workers.
    void shutdown();

    std::size_t pending() const;

private:
    struct Task {
        std::string label;
        std::function<void()> run;
    };

    void worker_loop();

    Logger& logger_;
    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
};

}  // namespace vault::server
