#pragma once

#include "command_router.hpp"
#include "config_loader.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "task_executor.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vault::server {

// Single-threaded epoll reactor. Long-running commands finish on the router's TaskExecutor and
// hand their responses back through an eventfd.
class VaultServer {
public:
    VaultServer(ServerConfig config, CommandRouter& router, TaskExecutor& executor, Logger& logger);
    ~VaultServer();

    void start();
    void stop();

private:
    struct ConnectionContext;
    struct PendingResponse {
        int fd;
        std::uint64_t connection_id;
        protocol::Message message;
    };

    void reactor_loop();
    void handle_accept();
    void handle_fd_event(int fd, uint32_t events);
    void drain_async_queue();
    void schedule_response(int fd, std::uint64_t connection_id, protocol::Message message);
    void close_connection(int fd);

    ServerConfig config_;
    CommandRouter& router_;
    TaskExecutor& executor_;
    Logger& logger_;
    std::size_t max_body_bytes_;

    int server_fd_ = -1;
    int epoll_fd_ = -1;
    int notify_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread reactor_thread_;

    std::uint64_t next_connection_id_ = 1;
    std::unordered_map<int, std::unique_ptr<ConnectionContext>> connections_;
    std::deque<std::pair<int, uint32_t>> ready_queue_;
    std::mutex async_mutex_;
    std::vector<PendingResponse> async_responses_;
};

}  // namespace vault::server
