#include "task_executor.hpp"

#include <exception>
#include <stdexcept>

namespace vault::server {

TaskExecutor::TaskExecutor(Logger& logger) : logger_(logger) {}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

void TaskExecutor::start(std::size_t worker_count) {
    if (!workers_.empty()) {
        return;
    }
    if (worker_count == 0) {
        throw std::invalid_argument("worker_count must be > 0");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&TaskExecutor::worker_loop, this);
    }
}

void TaskExecutor::submit(std::string label, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Task executor is shutting down");
        }
        tasks_.push(Task{std::move(label), std::move(task)});
    }
    cv_.notify_one();
}

void TaskExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

std::size_t TaskExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskExecutor::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task.run();
        } catch (const std::exception& ex) {
            logger_.error("Background task " + task.label + " failed: " + ex.what());
        }
    }
}

}  // namespace vault::server
