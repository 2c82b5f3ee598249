#include "vault_server.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace vault::server {

namespace {

constexpr int kMaxEvents = 128;
// Header block plus wire header on top of the largest accepted body.
constexpr std::size_t kFrameOverhead = protocol::kMaxHeaderBytes + 16;

void set_non_blocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw std::runtime_error("Failed to make socket non-blocking: " + std::string(std::strerror(errno)));
    }
}

void set_socket_keepalive(int fd) {
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
}

void signal_eventfd(int fd) {
    const uint64_t value = 1;
    while (::write(fd, &value, sizeof(value)) < 0 && errno == EINTR) {
    }
}

}  // namespace

struct VaultServer::ConnectionContext {
    int fd;
    std::uint64_t id;
    std::vector<std::byte> inbound;
    std::size_t inbound_offset = 0;
    std::vector<std::byte> outbound;
    ClientSession client;
};

VaultServer::VaultServer(ServerConfig config, CommandRouter& router, TaskExecutor& executor, Logger& logger)
    : config_(std::move(config)),
      router_(router),
      executor_(executor),
      logger_(logger),
      max_body_bytes_(static_cast<std::size_t>(
          std::max<std::uint64_t>(config_.max_chunk_bytes, config_.max_small_upload_bytes))) {}

VaultServer::~VaultServer() {
    stop();
}

void VaultServer::start() {
    if (running_) {
        return;
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }
    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.listen_port);
    if (::inet_pton(AF_INET, config_.listen_address.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen_address " + config_.listen_address);
    }
    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error("Failed to bind server socket: " + std::string(std::strerror(errno)));
    }
    if (::listen(server_fd_, static_cast<int>(config_.max_clients)) < 0) {
        throw std::runtime_error("Failed to listen on server socket");
    }
    set_non_blocking(server_fd_);

    epoll_fd_ = ::epoll_create1(0);
    if (epoll_fd_ < 0) {
        throw std::runtime_error("Failed to create epoll");
    }
    notify_fd_ = ::eventfd(0, EFD_NONBLOCK);
    if (notify_fd_ < 0) {
        throw std::runtime_error("Failed to create eventfd");
    }

    epoll_event server_event{};
    server_event.data.fd = server_fd_;
    server_event.events = EPOLLIN;
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &server_event);

    epoll_event notify_event{};
    notify_event.data.fd = notify_fd_;
    notify_event.events = EPOLLIN;
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, notify_fd_, &notify_event);

    executor_.start(config_.long_task_threads);

    running_ = true;
    reactor_thread_ = std::thread(&VaultServer::reactor_loop, this);
    logger_.info("Reactor listening on " + config_.listen_address + ":" + std::to_string(config_.listen_port));
}

void VaultServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    signal_eventfd(notify_fd_);

    if (reactor_thread_.joinable()) {
        reactor_thread_.join();
    }
    // Queued finalize and batch tasks still complete; their responses are dropped with the sockets.
    if (const auto queued = executor_.pending(); queued > 0) {
        logger_.info("Draining " + std::to_string(queued) + " background tasks before shutdown");
    }
    executor_.shutdown();

    for (auto& [fd, ctx] : connections_) {
        ::close(fd);
    }
    connections_.clear();
    ready_queue_.clear();
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        async_responses_.clear();
    }

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (notify_fd_ >= 0) {
        ::close(notify_fd_);
        notify_fd_ = -1;
    }
    logger_.info("Reactor stopped");
}

void VaultServer::reactor_loop() {
    std::array<epoll_event, kMaxEvents> events{};

    while (running_) {
        int ready = ::epoll_wait(epoll_fd_, events.data(), static_cast<int>(events.size()), 500);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_.error("epoll_wait failed: " + std::string(std::strerror(errno)));
            break;
        }
        for (int i = 0; i < ready; ++i) {
            const auto& event = events[i];
            if (event.data.fd == server_fd_) {
                handle_accept();
                continue;
            }
            if (event.data.fd == notify_fd_) {
                uint64_t tmp;
                while (::read(notify_fd_, &tmp, sizeof(tmp)) < 0 && errno == EINTR) {
                }
                drain_async_queue();
                continue;
            }
            ready_queue_.emplace_back(event.data.fd, event.events);
        }

        while (!ready_queue_.empty()) {
            auto [fd, mask] = ready_queue_.front();
            ready_queue_.pop_front();
            handle_fd_event(fd, mask);
        }
    }
}

void VaultServer::handle_accept() {
    while (true) {
        sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        int client_fd = ::accept4(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &len, SOCK_NONBLOCK);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            logger_.warn("accept failed: " + std::string(std::strerror(errno)));
            break;
        }
        set_socket_keepalive(client_fd);

        epoll_event event{};
        event.data.fd = client_fd;
        event.events = EPOLLIN | EPOLLRDHUP;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &event) < 0) {
            ::close(client_fd);
            continue;
        }

        std::array<char, INET_ADDRSTRLEN> address{};
        ::inet_ntop(AF_INET, &client_addr.sin_addr, address.data(), address.size());
        std::ostringstream peer;
        peer << address.data() << ":" << ntohs(client_addr.sin_port);

        auto ctx = std::make_unique<ConnectionContext>();
        ctx->fd = client_fd;
        ctx->id = next_connection_id_++;
        ctx->client.peer = peer.str();
        connections_.emplace(client_fd, std::move(ctx));
        logger_.info("Accepted connection from " + peer.str());
    }
}

void VaultServer::handle_fd_event(int fd, uint32_t events) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return;
    }
    auto& ctx = *it->second;

    if (events & (EPOLLHUP | EPOLLRDHUP | EPOLLERR)) {
        close_connection(fd);
        return;
    }

    if (events & EPOLLIN) {
        std::array<std::byte, 64 * 1024> buf{};
        while (true) {
            const ssize_t received = ::recv(fd, buf.data(), buf.size(), 0);
            if (received < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    break;
                }
                if (errno == EINTR) {
                    continue;
                }
                close_connection(fd);
                return;
            }
            if (received == 0) {
                close_connection(fd);
                return;
            }
            ctx.inbound.insert(ctx.inbound.end(), buf.begin(), buf.begin() + received);
            if (ctx.inbound.size() - ctx.inbound_offset > max_body_bytes_ + kFrameOverhead) {
                break;
            }
        }

        const auto connection_id = ctx.id;
        const CommandRouter::Reply reply = [this, fd, connection_id](protocol::Message message) {
            schedule_response(fd, connection_id, std::move(message));
        };
        try {
            protocol::Message message;
            while (protocol::try_decode(ctx.inbound, ctx.inbound_offset, message, max_body_bytes_)) {
                router_.dispatch(ctx.client, message, reply);
            }
        } catch (const protocol::ProtocolError& ex) {
            logger_.warn("Dropping connection " + ctx.client.peer + ": " + ex.what());
            close_connection(fd);
            return;
        }
    }

    if (events & EPOLLOUT) {
        while (!ctx.outbound.empty()) {
            const ssize_t sent = ::send(fd, ctx.outbound.data(), ctx.outbound.size(), MSG_NOSIGNAL);
            if (sent < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    break;
                }
                close_connection(fd);
                return;
            }
            ctx.outbound.erase(ctx.outbound.begin(), ctx.outbound.begin() + sent);
        }
        if (ctx.outbound.empty()) {
            epoll_event ev{};
            ev.data.fd = fd;
            ev.events = EPOLLIN | EPOLLRDHUP;
            ::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);
        }
    }
}

void VaultServer::schedule_response(int fd, std::uint64_t connection_id, protocol::Message message) {
    std::lock_guard<std::mutex> lock(async_mutex_);
    async_responses_.push_back(PendingResponse{fd, connection_id, std::move(message)});
    signal_eventfd(notify_fd_);
}

void VaultServer::drain_async_queue() {
    std::vector<PendingResponse> pending;
    {
        std::lock_guard<std::mutex> lock(async_mutex_);
        pending.swap(async_responses_);
    }
    for (auto& resp : pending) {
        auto it = connections_.find(resp.fd);
        // The descriptor may have been closed and reused by a newer connection.
        if (it == connections_.end() || it->second->id != resp.connection_id) {
            continue;
        }
        std::vector<std::byte> encoded;
        try {
            encoded = protocol::encode(resp.message);
        } catch (const std::exception& ex) {
            logger_.error("Cannot encode response for " + it->second->client.peer + ": " + ex.what());
            encoded = protocol::encode(protocol::make_message(
                {{"cmd", std::string(protocol::header_value(resp.message, "cmd"))}, {"status", "error"}}));
        }
        auto& buffer = it->second->outbound;
        buffer.insert(buffer.end(), encoded.begin(), encoded.end());

        epoll_event ev{};
        ev.data.fd = resp.fd;
        ev.events = EPOLLIN | EPOLLOUT | EPOLLRDHUP;
        ::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, resp.fd, &ev);
    }
}

void VaultServer::close_connection(int fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ::close(fd);
    connections_.erase(fd);
}

}  // namespace vault::server
