#include "chunk_upload_manager.hpp"

#include "random_id.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <map>
#include <stdexcept>

namespace vault::server {

namespace {

std::filesystem::path chunk_path(const std::filesystem::path& dir, std::uint64_t index) {
    return dir / (std::to_string(index) + ".chunk");
}

// Writes `data` to a new file. Returns 0 or an errno value.
int write_new_file(const std::filesystem::path& path, std::span<const std::byte> data) {
    const int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) {
        return errno;
    }
    std::size_t done = 0;
    while (done < data.size()) {
        const ssize_t written =
            ::pwrite(fd, data.data() + done, data.size() - done, static_cast<off_t>(done));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            ::close(fd);
            return err;
        }
        done += static_cast<std::size_t>(written);
    }
    if (::close(fd) != 0) {
        return errno;
    }
    return 0;
}

// Concatenation of `<dir>/0.chunk` .. `<dir>/<count-1>.chunk`.
class ChunkSequenceSource : public ByteSource {
public:
    ChunkSequenceSource(std::filesystem::path dir, std::uint64_t count) : dir_(std::move(dir)), count_(count) {}

    std::size_t read(std::span<std::byte> buffer) override {
        std::size_t filled = 0;
        while (filled < buffer.size()) {
            if (!stream_.is_open()) {
                if (next_ >= count_) {
                    break;
                }
                stream_.open(chunk_path(dir_, next_), std::ios::binary);
                if (!stream_) {
                    throw std::runtime_error("staged chunk " + std::to_string(next_) + " is missing");
                }
                ++next_;
            }
            stream_.read(reinterpret_cast<char*>(buffer.data() + filled),
                         static_cast<std::streamsize>(buffer.size() - filled));
            filled += static_cast<std::size_t>(stream_.gcount());
            if (stream_.bad()) {
                throw std::runtime_error("failed reading staged chunk " + std::to_string(next_ - 1));
            }
            if (stream_.eof()) {
                stream_.close();
                stream_.clear();
            }
        }
        return filled;
    }

private:
    std::filesystem::path dir_;
    std::uint64_t count_;
    std::uint64_t next_ = 0;
    std::ifstream stream_;
};

}  // namespace

std::string_view state_name(SessionState state) {
    switch (state) {
        case SessionState::kOpen:
            return "open";
        case SessionState::kReceiving:
            return "receiving";
        case SessionState::kFinalizing:
            return "finalizing";
        case SessionState::kCompleted:
            return "completed";
        case SessionState::kAborted:
            return "aborted";
    }
    return "unknown";
}

struct ChunkUploadManager::Session {
    std::string id;
    std::string user_id;
    ResolvedPath destination;
    std::string reservation;
    std::filesystem::path staging_dir;

    SessionState state = SessionState::kOpen;
    std::optional<std::uint64_t> declared_total;
    std::int64_t highest_index = -1;
    std::set<std::uint64_t> received;
    std::map<std::uint64_t, std::uint64_t> chunk_sizes;
    std::uint64_t staged_bytes = 0;
    // Bytes of admitted writes still on their way to disk.
    std::uint64_t reserved_bytes = 0;

    Clock::time_point created_at;
    Clock::time_point last_activity;
    std::size_t writes_in_flight = 0;
    // Set when the put of a complete upload failed; staged chunks stay so finish can be retried.
    bool retry_finalize = false;
    // Removed from the table; the last in-flight writer deletes the staging directory.
    bool detached = false;
};

ChunkUploadManager::ChunkUploadManager(StorageTree& tree,
                                       std::filesystem::path staging_root,
                                       UploadLimits limits,
                                       Logger& logger)
    : tree_(tree), staging_root_(std::move(staging_root)), limits_(limits), logger_(logger) {
    purge_stale_staging();
}

ChunkUploadManager::~ChunkUploadManager() {
    stop_sweeper();
}

void ChunkUploadManager::purge_stale_staging() {
    std::filesystem::create_directories(staging_root_);
    std::size_t purged = 0;
    for (const auto& entry : std::filesystem::directory_iterator(staging_root_)) {
        std::error_code ec;
        std::filesystem::remove_all(entry.path(), ec);
        if (ec) {
            logger_.warn("Unable to purge stale staging " + entry.path().string() + ": " + ec.message());
            continue;
        }
        ++purged;
    }
    if (purged > 0) {
        logger_.info("Purged " + std::to_string(purged) + " stale upload staging directories");
    }
}

std::string ChunkUploadManager::reservation_key(const std::string& user_id, const ResolvedPath& destination) {
    return user_id + '\n' + destination.relative();
}

std::shared_ptr<ChunkUploadManager::Session> ChunkUploadManager::find_owned(const std::string& user_id,
                                                                          const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    if (it->second->user_id != user_id) {
        logger_.security("User " + user_id + " referenced upload session owned by user " + it->second->user_id);
        return nullptr;
    }
    return it->second;
}

void ChunkUploadManager::erase_locked(const std::shared_ptr<Session>& session) {
    sessions_.erase(session->id);
    reservations_.erase(session->reservation);
    session->detached = true;
}

void ChunkUploadManager::discard_staging(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        logger_.warn("Unable to discard staging " + dir.string() + ": " + ec.message());
    }
}

Result<std::string> ChunkUploadManager::begin_upload(const std::string& user_id,
                                                     std::string_view destination,
                                                     std::optional<std::uint64_t> total_chunks) {
    auto target = tree_.resolve(user_id, destination);
    if (!target) {
        return target.error();
    }
    if (total_chunks && *total_chunks > limits_.max_chunks) {
        return make_error(StorageErrc::kInvalid, "too many chunks");
    }
    std::error_code ec;
    if (std::filesystem::is_directory(std::filesystem::symlink_status(target->absolute, ec))) {
        return make_error(StorageErrc::kConflict, "a folder exists at the destination");
    }

    auto session = std::make_shared<Session>();
    session->user_id = user_id;
    session->destination = target.value();
    session->reservation = reservation_key(user_id, session->destination);
    session->declared_total = total_chunks;
    session->created_at = Clock::now();
    session->last_activity = session->created_at;

    std::lock_guard<std::mutex> lock(mutex_);
    if (reservations_.count(session->reservation) > 0) {
        return make_error(StorageErrc::kConflict, "destination already has an active upload");
    }
    try {
        do {
            session->id = random_hex(16);
        } while (sessions_.count(session->id) > 0);
    } catch (const std::exception& ex) {
        return make_error(StorageErrc::kIoFailure, ex.what());
    }
    session->staging_dir = staging_root_ / session->id;
    std::filesystem::create_directory(session->staging_dir, ec);
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "cannot create staging: " + ec.message());
    }
    sessions_.emplace(session->id, session);
    reservations_.emplace(session->reservation, session->id);
    logger_.info("Upload " + session->id + " opened by user " + user_id + " for " +
                 session->destination.relative());
    return session->id;
}

Status ChunkUploadManager::write_chunk(const std::string& user_id,
                                       const std::string& session_id,
                                       std::int64_t index,
                                       std::span<const std::byte> data) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = find_owned(user_id, session_id);
        if (!session) {
            return make_error(StorageErrc::kNotFound, "unknown upload session");
        }
        if (session->state != SessionState::kOpen && session->state != SessionState::kReceiving) {
            return make_error(StorageErrc::kInvalid, "session is " + std::string(state_name(session->state)));
        }
        if (index < 0) {
            return make_error(StorageErrc::kInvalid, "negative chunk index");
        }
        const auto slot = static_cast<std::uint64_t>(index);
        if ((session->declared_total && slot >= *session->declared_total) || slot >= limits_.max_chunks) {
            return make_error(StorageErrc::kInvalid, "chunk index out of range");
        }
        if (data.size() > limits_.max_chunk_bytes) {
            return make_error(StorageErrc::kInvalid, "chunk too large");
        }
        const auto previous = session->chunk_sizes.find(slot);
        const std::uint64_t replaced = previous == session->chunk_sizes.end() ? 0 : previous->second;
        if (session->staged_bytes - replaced + session->reserved_bytes + data.size() > limits_.max_upload_bytes) {
            return make_error(StorageErrc::kInvalid, "upload exceeds size limit");
        }
        session->state = SessionState::kReceiving;
        session->last_activity = Clock::now();
        session->reserved_bytes += data.size();
        ++session->writes_in_flight;
    }

    // Each write lands under a private name and is renamed into its slot, so a retry of the same
    // index replaces the previous bytes whole and finalize never reads a half-written chunk.
    const auto slot = static_cast<std::uint64_t>(index);
    const auto final_path = chunk_path(session->staging_dir, slot);
    Status result = ok_status();
    try {
        const auto temp_path = session->staging_dir / (std::to_string(slot) + ".tmp-" + random_hex(6));
        int err = write_new_file(temp_path, data);
        if (err == 0 && ::rename(temp_path.c_str(), final_path.c_str()) != 0) {
            err = errno;
        }
        if (err != 0) {
            ::unlink(temp_path.c_str());
            result = make_error(StorageErrc::kIoFailure, std::string("stage chunk: ") + std::strerror(err));
        }
    } catch (const std::exception& ex) {
        result = make_error(StorageErrc::kIoFailure, ex.what());
    }

    bool discard = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --session->writes_in_flight;
        session->reserved_bytes -= data.size();
        if (result) {
            auto& size = session->chunk_sizes[slot];
            session->staged_bytes = session->staged_bytes - size + data.size();
            size = data.size();
            session->received.insert(slot);
            session->highest_index = std::max<std::int64_t>(session->highest_index, index);
            session->last_activity = Clock::now();
        }
        discard = session->detached && session->writes_in_flight == 0;
    }
    writes_done_.notify_all();
    if (discard) {
        discard_staging(session->staging_dir);
    }
    if (!result) {
        logger_.error("Upload " + session_id + " chunk " + std::to_string(index) + " failed: " +
                      result.error().detail);
    }
    return result;
}

Result<NodeInfo> ChunkUploadManager::finish_upload(const std::string& user_id,
                                                   const std::string& session_id,
                                                   std::optional<std::uint64_t> total_chunks) {
    std::shared_ptr<Session> session;
    std::uint64_t total = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        session = find_owned(user_id, session_id);
        if (!session) {
            return make_error(StorageErrc::kNotFound, "unknown upload session");
        }
        const bool retry = session->state == SessionState::kAborted && session->retry_finalize;
        if (session->state != SessionState::kOpen && session->state != SessionState::kReceiving && !retry) {
            return make_error(StorageErrc::kInvalid, "session is " + std::string(state_name(session->state)));
        }
        // The first total supplied, at open or here, is authoritative.
        const bool recorded_here = total_chunks && !session->declared_total;
        if (total_chunks) {
            if (session->declared_total && *session->declared_total != *total_chunks) {
                return make_error(StorageErrc::kIncomplete, "chunk total differs from the declared total");
            }
            if (*total_chunks > limits_.max_chunks) {
                return make_error(StorageErrc::kInvalid, "too many chunks");
            }
            // A total the received chunks already exceed is not recorded.
            if (session->highest_index >= 0 &&
                *total_chunks <= static_cast<std::uint64_t>(session->highest_index)) {
                return make_error(StorageErrc::kIncomplete, "chunk total below the highest received index");
            }
            session->declared_total = total_chunks;
        }
        if (!session->declared_total) {
            return make_error(StorageErrc::kIncomplete, "chunk total unknown");
        }
        total = *session->declared_total;

        const auto previous_state = session->state;
        session->state = SessionState::kFinalizing;
        writes_done_.wait(lock, [&] { return session->writes_in_flight == 0; });
        session->last_activity = Clock::now();

        const bool complete = session->received.size() == total &&
                              (total == 0 || *session->received.rbegin() == total - 1);
        if (!complete) {
            session->state = previous_state;
            // A write that landed while waiting may have gone past the total given here.
            if (recorded_here && session->highest_index >= static_cast<std::int64_t>(total)) {
                session->declared_total.reset();
            }
            return make_error(StorageErrc::kIncomplete,
                              std::to_string(session->received.size()) + " of " + std::to_string(total) +
                                  " chunks received");
        }
    }

    ChunkSequenceSource source(session->staging_dir, total);
    auto node = tree_.put(session->destination, source);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->last_activity = Clock::now();
        if (!node) {
            session->state = SessionState::kAborted;
            session->retry_finalize = true;
        } else {
            session->state = SessionState::kCompleted;
            erase_locked(session);
        }
    }
    if (!node) {
        logger_.error("Upload " + session_id + " finalize failed: " + node.error().detail);
        return node.error();
    }
    discard_staging(session->staging_dir);
    logger_.info("Upload " + session_id + " completed: " + node->path + " (" + std::to_string(node->size) +
                 " bytes, " + std::to_string(total) + " chunks)");
    return node;
}

Status ChunkUploadManager::abort_upload(const std::string& user_id, const std::string& session_id) {
    std::shared_ptr<Session> session;
    bool discard = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = find_owned(user_id, session_id);
        if (!session) {
            return make_error(StorageErrc::kNotFound, "unknown upload session");
        }
        if (session->state == SessionState::kFinalizing) {
            return make_error(StorageErrc::kInvalid, "session is finalizing");
        }
        session->state = SessionState::kAborted;
        erase_locked(session);
        discard = session->writes_in_flight == 0;
    }
    if (discard) {
        discard_staging(session->staging_dir);
    }
    logger_.info("Upload " + session_id + " aborted by user " + user_id);
    return ok_status();
}

Result<UploadStatus> ChunkUploadManager::upload_status(const std::string& user_id,
                                                       const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session = find_owned(user_id, session_id);
    if (!session) {
        return make_error(StorageErrc::kNotFound, "unknown upload session");
    }
    return UploadStatus{session->id,
                        session->destination.relative(),
                        session->state,
                        session->declared_total,
                        session->highest_index,
                        std::vector<std::uint64_t>(session->received.begin(), session->received.end()),
                        session->staged_bytes};
}

std::size_t ChunkUploadManager::evict_idle(Clock::time_point now) {
    std::vector<std::shared_ptr<Session>> evicted;
    std::vector<std::filesystem::path> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session->state == SessionState::kFinalizing) {
                continue;
            }
            if (now - session->last_activity >= limits_.idle_timeout) {
                evicted.push_back(session);
            }
        }
        for (const auto& session : evicted) {
            session->state = SessionState::kAborted;
            erase_locked(session);
            if (session->writes_in_flight == 0) {
                doomed.push_back(session->staging_dir);
            }
        }
    }
    for (const auto& dir : doomed) {
        discard_staging(dir);
    }
    for (const auto& session : evicted) {
        logger_.info("Upload " + session->id + " of user " + session->user_id + " evicted after inactivity");
    }
    return evicted.size();
}

void ChunkUploadManager::start_sweeper(std::chrono::milliseconds interval) {
    if (sweeper_thread_.joinable()) {
        return;
    }
    if (interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("sweep interval must be > 0");
    }
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stopping_ = false;
    }
    sweeper_thread_ = std::thread(&ChunkUploadManager::sweeper_loop, this, interval);
}

void ChunkUploadManager::stop_sweeper() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stopping_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
}

void ChunkUploadManager::sweeper_loop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!sweeper_stopping_) {
        if (sweeper_cv_.wait_for(lock, interval, [this] { return sweeper_stopping_; })) {
            break;
        }
        lock.unlock();
        try {
            evict_idle(Clock::now());
        } catch (const std::exception& ex) {
            logger_.error(std::string("Upload sweep failed: ") + ex.what());
        }
        lock.lock();
    }
}

std::size_t ChunkUploadManager::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace vault::server
