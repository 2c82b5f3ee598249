#pragma once

#include "logger.hpp"
#include "path_resolver.hpp"
#include "storage_error.hpp"
#include "storage_tree.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vault::server {

enum class SessionState {
    kOpen,
    kReceiving,
    kFinalizing,
    kCompleted,
    kAborted,
};

std::string_view state_name(SessionState state);

struct UploadLimits {
    std::size_t max_chunk_bytes = 8 * 1024 * 1024;
    std::uint64_t max_upload_bytes = 20ULL * 1024 * 1024 * 1024;
    std::uint64_t max_chunks = 1 << 20;
    std::chrono::seconds idle_timeout{30 * 60};
};

struct UploadStatus {
    std::string session_id;
    std::string destination;
    SessionState state;
    std::optional<std::uint64_t> declared_total;
    std::int64_t highest_index;
    std::vector<std::uint64_t> received;
    std::uint64_t staged_bytes;
};

// In-flight chunked uploads.
//
// Each session stages chunk `i` as `<staging_root>/<session id>/<i>.chunk`, outside every user
// root, and reserves its (user, destination) pair until it is destroyed. finish_upload streams
// the chunks in index order into StorageTree::put, so the destination changes in one rename.
class ChunkUploadManager {
public:
    using Clock = std::chrono::steady_clock;

    ChunkUploadManager(StorageTree& tree, std::filesystem::path staging_root, UploadLimits limits, Logger& logger);
    ~ChunkUploadManager();

    ChunkUploadManager(const ChunkUploadManager&) = delete;
    ChunkUploadManager& operator=(const ChunkUploadManager&) = delete;

    Result<std::string> begin_upload(const std::string& user_id,
                                     std::string_view destination,
                                     std::optional<std::uint64_t> total_chunks = std::nullopt);
    Status write_chunk(const std::string& user_id,
                       const std::string& session_id,
                       std::int64_t index,
                       std::span<const std::byte> data);
    Result<NodeInfo> finish_upload(const std::string& user_id,
                                   const std::string& session_id,
                                   std::optional<std::uint64_t> total_chunks = std::nullopt);
    Status abort_upload(const std::string& user_id, const std::string& session_id);
    Result<UploadStatus> upload_status(const std::string& user_id, const std::string& session_id) const;

    // Aborts every session idle since before `now - idle_timeout`. Returns how many were evicted.
    std::size_t evict_idle(Clock::time_point now);
    void start_sweeper(std::chrono::milliseconds interval);
    void stop_sweeper();

    std::size_t active_sessions() const;

private:
    struct Session;

    static std::string reservation_key(const std::string& user_id, const ResolvedPath& destination);
    std::shared_ptr<Session> find_owned(const std::string& user_id, const std::string& session_id) const;
    void erase_locked(const std::shared_ptr<Session>& session);
    void discard_staging(const std::filesystem::path& dir);
    void purge_stale_staging();
    void sweeper_loop(std::chrono::milliseconds interval);

    StorageTree& tree_;
    std::filesystem::path staging_root_;
    UploadLimits limits_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::condition_variable writes_done_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::unordered_map<std::string, std::string> reservations_;

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stopping_{false};
    std::thread sweeper_thread_;
};

}  // namespace vault::server
