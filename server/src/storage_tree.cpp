#include "storage_tree.hpp"

#include "random_id.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace vault::server {

namespace {
constexpr std::uint64_t kMmapThreshold = 100ULL * 1024 * 1024;
constexpr std::size_t kCopyBlock = 1024 * 1024;
constexpr std::size_t kMaxUserIdLength = 64;

bool valid_user_id(const std::string& user_id) {
    if (user_id.empty() || user_id.size() > kMaxUserIdLength) {
        return false;
    }
    return std::all_of(user_id.begin(), user_id.end(), [](char ch) {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_' ||
               ch == '-';
    });
}

bool is_temp_name(const std::string& name) {
    return name.rfind(kTempPrefix, 0) == 0;
}

std::int64_t to_unix_seconds(std::filesystem::file_time_type ftime) {
    const auto sys_time = decltype(ftime)::clock::to_sys(ftime);
    return std::chrono::duration_cast<std::chrono::seconds>(sys_time.time_since_epoch()).count();
}

StorageError from_errno(int err, std::string_view what) {
    std::string detail = std::string(what) + ": " + std::strerror(err);
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return make_error(StorageErrc::kNotFound, std::move(detail));
        case EEXIST:
        case ENOTEMPTY:
        case EISDIR:
            return make_error(StorageErrc::kConflict, std::move(detail));
        case EINVAL:
            return make_error(StorageErrc::kInvalid, std::move(detail));
        default:
            return make_error(StorageErrc::kIoFailure, std::move(detail));
    }
}

bool write_all(int fd, const std::byte* data, std::size_t length) {
    std::size_t done = 0;
    while (done < length) {
        const ssize_t written = ::write(fd, data + done, length - done);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        done += static_cast<std::size_t>(written);
    }
    return true;
}

// Atomic rename that refuses to replace an existing destination. Returns 0 or an errno value.
int rename_no_replace(const std::filesystem::path& from, const std::filesystem::path& to) {
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return 0;
    }
    if (errno != EINVAL && errno != ENOSYS) {
        return errno;
    }
    // Filesystem without RENAME_NOREPLACE support.
    struct stat st {};
    if (::lstat(to.c_str(), &st) == 0) {
        return EEXIST;
    }
    if (::rename(from.c_str(), to.c_str()) == 0) {
        return 0;
    }
    return errno;
}

bool has_prefix(const std::vector<std::string>& path, const std::vector<std::string>& prefix) {
    return path.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), path.begin());
}

std::optional<StorageNode> make_node(const std::filesystem::directory_entry& entry) {
    std::error_code ec;
    StorageNode node{entry.path().filename().string(), NodeKind::kFile, 0, 0};
    if (entry.is_directory(ec)) {
        node.kind = NodeKind::kFolder;
    } else if (entry.is_regular_file(ec)) {
        node.size = entry.file_size(ec);
        if (ec) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    const auto ftime = entry.last_write_time(ec);
    if (ec) {
        return std::nullopt;
    }
    node.modified = to_unix_seconds(ftime);
    return node;
}

}  // namespace

std::size_t BufferSource::read(std::span<std::byte> buffer) {
    const auto count = std::min(buffer.size(), data_.size() - offset_);
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + offset_, count);
        offset_ += count;
    }
    return count;
}

StorageTree::StorageTree(std::filesystem::path users_root, PathResolver resolver, Logger& logger)
    : users_root_(std::move(users_root)), resolver_(resolver), logger_(logger) {
    std::filesystem::create_directories(users_root_);
}

std::filesystem::path StorageTree::user_root(const std::string& user_id) const {
    return users_root_ / ("user_" + user_id);
}

StorageError StorageTree::report(const std::string& user_id, StorageError error) const {
    if (error.code == StorageErrc::kTraversal) {
        logger_.security("Traversal attempt by user " + user_id + " (" + error.detail + ")");
    }
    return error;
}

Status StorageTree::ensure_user_root(const std::string& user_id) {
    std::error_code ec;
    std::filesystem::create_directories(user_root(user_id), ec);
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "cannot create user root: " + ec.message());
    }
    return ok_status();
}

Result<ResolvedPath> StorageTree::resolve(const std::string& user_id, std::string_view raw_path, bool allow_root) {
    if (!valid_user_id(user_id)) {
        return make_error(StorageErrc::kMalformed, "invalid user id");
    }
    auto resolved = resolver_.resolve(user_root(user_id), raw_path, allow_root);
    if (!resolved) {
        return report(user_id, resolved.error());
    }
    auto root = ensure_user_root(user_id);
    if (!root) {
        return root.error();
    }
    return resolved;
}

Result<ResolvedPath> StorageTree::resolve_segments(const std::string& user_id,
                                                   std::vector<std::string> segments,
                                                   bool allow_root) {
    if (!valid_user_id(user_id)) {
        return make_error(StorageErrc::kMalformed, "invalid user id");
    }
    auto resolved = resolver_.resolve_segments(user_root(user_id), std::move(segments), allow_root);
    if (!resolved) {
        return report(user_id, resolved.error());
    }
    auto root = ensure_user_root(user_id);
    if (!root) {
        return root.error();
    }
    return resolved;
}

Result<ResolvedPath> StorageTree::resolve_under(const std::string& user_id,
                                                const ResolvedPath& base,
                                                std::string_view raw_path) {
    auto relative = resolver_.split(raw_path);
    if (!relative) {
        return report(user_id, relative.error());
    }
    auto segments = base.segments;
    segments.insert(segments.end(), relative->begin(), relative->end());
    return resolve_segments(user_id, std::move(segments));
}

bool StorageTree::is_listable(const std::filesystem::path& root,
                              const ResolvedPath& folder,
                              const std::filesystem::directory_entry& entry) const {
    const auto name = entry.path().filename().string();
    if (is_temp_name(name)) {
        return false;
    }
    std::error_code ec;
    if (!entry.is_symlink(ec)) {
        return !ec;
    }
    // Symlinks are shown only while they stay inside the user root.
    auto segments = folder.segments;
    segments.push_back(name);
    return resolver_.resolve_segments(root, std::move(segments)).ok();
}

Result<std::vector<StorageNode>> StorageTree::list(const std::string& user_id, std::string_view raw_path) {
    auto target = resolve(user_id, raw_path, true);
    if (!target) {
        return target.error();
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(target->absolute, ec)) {
        return make_error(StorageErrc::kNotFound, "not a folder");
    }

    const auto root = user_root(user_id);
    std::vector<StorageNode> entries;
    std::filesystem::directory_iterator it(target->absolute, ec);
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "cannot open folder: " + ec.message());
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return make_error(StorageErrc::kIoFailure, "cannot read folder: " + ec.message());
        }
        if (!is_listable(root, target.value(), *it)) {
            continue;
        }
        if (auto node = make_node(*it)) {
            entries.push_back(std::move(*node));
        }
    }
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "cannot read folder: " + ec.message());
    }
    std::sort(entries.begin(), entries.end(),
              [](const StorageNode& lhs, const StorageNode& rhs) { return lhs.name < rhs.name; });
    return entries;
}

TreeNode StorageTree::walk_folder(const std::filesystem::path& root, const ResolvedPath& folder) const {
    TreeNode node{folder.name(), folder.relative(), NodeKind::kFolder, 0, {}};
    std::error_code ec;
    std::filesystem::directory_iterator it(folder.absolute, ec);
    if (ec) {
        logger_.warn("Skipping unreadable folder " + folder.absolute.string() + ": " + ec.message());
        return node;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec || !is_listable(root, folder, *it)) {
            continue;
        }
        auto entry = make_node(*it);
        if (!entry) {
            continue;
        }
        ResolvedPath child{folder.segments, folder.absolute / entry->name};
        child.segments.push_back(entry->name);
        std::error_code link_ec;
        // Symlinked folders are reported but never descended into, so link cycles cannot recurse.
        if (entry->kind == NodeKind::kFolder && !it->is_symlink(link_ec)) {
            node.children.push_back(walk_folder(root, child));
        } else {
            node.children.push_back(TreeNode{entry->name, child.relative(), entry->kind, entry->size, {}});
        }
    }
    std::sort(node.children.begin(), node.children.end(),
              [](const TreeNode& lhs, const TreeNode& rhs) { return lhs.name < rhs.name; });
    return node;
}

Result<TreeNode> StorageTree::walk(const std::string& user_id, std::string_view raw_path) {
    auto target = resolve(user_id, raw_path, true);
    if (!target) {
        return target.error();
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(target->absolute, ec)) {
        return make_error(StorageErrc::kNotFound, "not a folder");
    }
    return walk_folder(user_root(user_id), target.value());
}

Result<NodeInfo> StorageTree::describe(const ResolvedPath& target) const {
    std::error_code ec;
    const auto status = std::filesystem::status(target.absolute, ec);
    if (!std::filesystem::exists(status)) {
        return make_error(StorageErrc::kNotFound, "no such node");
    }
    NodeInfo info{target.relative(), NodeKind::kFile, 0, 0};
    if (std::filesystem::is_directory(status)) {
        info.kind = NodeKind::kFolder;
    } else {
        info.size = std::filesystem::file_size(target.absolute, ec);
        if (ec) {
            return make_error(StorageErrc::kIoFailure, "cannot read size: " + ec.message());
        }
    }
    const auto ftime = std::filesystem::last_write_time(target.absolute, ec);
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "cannot read mtime: " + ec.message());
    }
    info.modified = to_unix_seconds(ftime);
    return info;
}

Result<NodeInfo> StorageTree::stat(const std::string& user_id, std::string_view raw_path) {
    auto target = resolve(user_id, raw_path, true);
    if (!target) {
        return target.error();
    }
    return describe(target.value());
}

Status StorageTree::ensure_parents(const ResolvedPath& target) {
    auto current = target.absolute;
    for (std::size_t i = 0; i < target.segments.size(); ++i) {
        current = current.parent_path();
    }
    for (std::size_t i = 0; i + 1 < target.segments.size(); ++i) {
        current /= target.segments[i];
        std::error_code ec;
        const auto status = std::filesystem::status(current, ec);
        if (std::filesystem::is_directory(status)) {
            continue;
        }
        if (std::filesystem::exists(status)) {
            return make_error(StorageErrc::kConflict, "intermediate node is a file");
        }
        if (::mkdir(current.c_str(), 0755) != 0) {
            const int err = errno;
            if (err == EEXIST && std::filesystem::is_directory(current, ec)) {
                continue;
            }
            return from_errno(err, "mkdir");
        }
    }
    return ok_status();
}

Status StorageTree::create_folder(const std::string& user_id, std::string_view raw_path) {
    auto target = resolve(user_id, raw_path);
    if (!target) {
        return target.error();
    }
    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(target->absolute, ec))) {
        return make_error(StorageErrc::kConflict, "node exists");
    }
    auto parents = ensure_parents(target.value());
    if (!parents) {
        return parents.error();
    }
    if (::mkdir(target->absolute.c_str(), 0755) != 0) {
        return from_errno(errno, "mkdir");
    }
    return ok_status();
}

Status StorageTree::remove(const std::string& user_id, std::string_view raw_path) {
    auto target = resolve(user_id, raw_path);
    if (!target) {
        return target.error();
    }
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(target->absolute, ec);
    if (!std::filesystem::exists(status)) {
        return make_error(StorageErrc::kNotFound, "no such node");
    }
    if (std::filesystem::is_directory(status)) {
        std::filesystem::remove_all(target->absolute, ec);
    } else {
        std::filesystem::remove(target->absolute, ec);
    }
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "remove failed: " + ec.message());
    }
    logger_.info("User " + user_id + " removed " + target->relative());
    return ok_status();
}

Status StorageTree::rename_resolved(const ResolvedPath& from, const ResolvedPath& to) {
    if (from.is_root() || to.is_root()) {
        return make_error(StorageErrc::kMalformed, "cannot rename the root");
    }
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(from.absolute, ec))) {
        return make_error(StorageErrc::kNotFound, "source missing");
    }
    if (to.segments == from.segments) {
        return make_error(StorageErrc::kConflict, "destination exists");
    }
    if (has_prefix(to.segments, from.segments)) {
        return make_error(StorageErrc::kInvalid, "cannot move a folder into itself");
    }
    if (!std::filesystem::is_directory(to.absolute.parent_path(), ec)) {
        return make_error(StorageErrc::kNotFound, "destination folder missing");
    }
    const int err = rename_no_replace(from.absolute, to.absolute);
    if (err != 0) {
        return from_errno(err, "rename");
    }
    return ok_status();
}

Status StorageTree::rename(const std::string& user_id, std::string_view old_path, std::string_view new_path) {
    auto from = resolve(user_id, old_path);
    if (!from) {
        return from.error();
    }
    auto to = resolve(user_id, new_path);
    if (!to) {
        return to.error();
    }
    return rename_resolved(from.value(), to.value());
}

Status StorageTree::rename_entry(const std::string& user_id, std::string_view raw_path, std::string_view new_name) {
    auto from = resolve(user_id, raw_path);
    if (!from) {
        return from.error();
    }
    auto name = resolver_.split(new_name);
    if (!name) {
        return report(user_id, name.error());
    }
    if (name->size() != 1) {
        return make_error(StorageErrc::kMalformed, "new name must be a single segment");
    }
    auto segments = from->segments;
    segments.back() = name->front();
    auto to = resolve_segments(user_id, std::move(segments));
    if (!to) {
        return to.error();
    }
    return rename_resolved(from.value(), to.value());
}

Status StorageTree::move(const std::string& user_id, std::string_view old_path, std::string_view new_folder) {
    auto from = resolve(user_id, old_path);
    if (!from) {
        return from.error();
    }
    auto folder = resolve(user_id, new_folder, true);
    if (!folder) {
        return folder.error();
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(folder->absolute, ec)) {
        return make_error(StorageErrc::kNotFound, "destination folder missing");
    }
    auto segments = folder->segments;
    segments.push_back(from->name());
    auto to = resolve_segments(user_id, std::move(segments));
    if (!to) {
        return to.error();
    }
    return rename_resolved(from.value(), to.value());
}

Result<NodeInfo> StorageTree::put(const std::string& user_id, std::string_view raw_path, ByteSource& source) {
    auto target = resolve(user_id, raw_path);
    if (!target) {
        return target.error();
    }
    return put(target.value(), source);
}

Result<NodeInfo> StorageTree::put(const ResolvedPath& destination, ByteSource& source) {
    if (destination.is_root()) {
        return make_error(StorageErrc::kMalformed, "cannot write the root");
    }
    auto parents = ensure_parents(destination);
    if (!parents) {
        return parents.error();
    }
    std::error_code ec;
    if (std::filesystem::is_directory(std::filesystem::symlink_status(destination.absolute, ec))) {
        return make_error(StorageErrc::kConflict, "a folder exists at the destination");
    }

    std::filesystem::path temp;
    try {
        temp = destination.absolute.parent_path() / (std::string(kTempPrefix) + random_hex(8));
    } catch (const std::exception& ex) {
        return make_error(StorageErrc::kIoFailure, ex.what());
    }
    const int fd = ::open(temp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_error(StorageErrc::kIoFailure, std::string("open temp: ") + std::strerror(errno));
    }

    std::vector<std::byte> buffer(kCopyBlock);
    try {
        while (true) {
            const auto count = source.read(buffer);
            if (count == 0) {
                break;
            }
            if (!write_all(fd, buffer.data(), count)) {
                const int err = errno;
                ::close(fd);
                ::unlink(temp.c_str());
                return make_error(StorageErrc::kIoFailure, std::string("write temp: ") + std::strerror(err));
            }
        }
    } catch (const std::exception& ex) {
        ::close(fd);
        ::unlink(temp.c_str());
        return make_error(StorageErrc::kIoFailure, std::string("read source: ") + ex.what());
    }

    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        ::unlink(temp.c_str());
        return make_error(StorageErrc::kIoFailure, std::string("fsync temp: ") + std::strerror(err));
    }
    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(temp.c_str());
        return make_error(StorageErrc::kIoFailure, std::string("close temp: ") + std::strerror(err));
    }
    if (::rename(temp.c_str(), destination.absolute.c_str()) != 0) {
        const int err = errno;
        ::unlink(temp.c_str());
        if (err == EISDIR || err == ENOTEMPTY || err == EEXIST) {
            return make_error(StorageErrc::kConflict, "a folder exists at the destination");
        }
        return make_error(StorageErrc::kIoFailure, std::string("rename temp: ") + std::strerror(err));
    }
    return describe(destination);
}

Result<std::vector<std::byte>> StorageTree::read(const std::string& user_id,
                                                 std::string_view raw_path,
                                                 std::uint64_t offset,
                                                 std::size_t length) {
    auto target = resolve(user_id, raw_path);
    if (!target) {
        return target.error();
    }
    const auto& absolute = target->absolute;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(absolute, ec)) {
        return make_error(StorageErrc::kNotFound, "not a file");
    }
    const auto size = std::filesystem::file_size(absolute, ec);
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "cannot read size: " + ec.message());
    }
    if (offset >= size || length == 0) {
        return std::vector<std::byte>{};
    }
    const std::size_t to_read = static_cast<std::size_t>(std::min<std::uint64_t>(length, size - offset));
    std::vector<std::byte> buffer(to_read);

    if (size >= kMmapThreshold) {
        const int fd = ::open(absolute.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            return make_error(StorageErrc::kIoFailure, std::string("open: ") + std::strerror(errno));
        }
        const long page_size = sysconf(_SC_PAGESIZE);
        const std::uint64_t page_offset = offset % static_cast<std::uint64_t>(page_size);
        const std::uint64_t map_offset = offset - page_offset;
        const std::size_t map_length = static_cast<std::size_t>(page_offset + to_read);
        void* mapped =
            ::mmap(nullptr, map_length, PROT_READ, MAP_PRIVATE, fd, static_cast<off_t>(map_offset));
        if (mapped == MAP_FAILED) {
            const int err = errno;
            ::close(fd);
            return make_error(StorageErrc::kIoFailure, std::string("mmap: ") + std::strerror(err));
        }
        std::memcpy(buffer.data(), static_cast<char*>(mapped) + page_offset, to_read);
        ::munmap(mapped, map_length);
        ::close(fd);
    } else {
        std::ifstream stream(absolute, std::ios::binary);
        stream.seekg(static_cast<std::streamoff>(offset));
        stream.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(to_read));
        if (!stream) {
            return make_error(StorageErrc::kIoFailure, "short read");
        }
    }
    return buffer;
}

Result<UsageStats> StorageTree::usage(const std::string& user_id) {
    auto root = resolve(user_id, "", true);
    if (!root) {
        return root.error();
    }
    UsageStats stats;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root->absolute, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "cannot scan user root: " + ec.message());
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return make_error(StorageErrc::kIoFailure, "cannot scan user root: " + ec.message());
        }
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec) || !it->is_regular_file(entry_ec)) {
            continue;
        }
        if (is_temp_name(it->path().filename().string())) {
            continue;
        }
        const auto size = it->file_size(entry_ec);
        if (!entry_ec) {
            stats.used_bytes += size;
            ++stats.file_count;
        }
    }
    return stats;
}

Result<DiskStats> StorageTree::disk_stats() const {
    std::error_code ec;
    const auto info = std::filesystem::space(users_root_, ec);
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "statvfs failed: " + ec.message());
    }
    return DiskStats{info.capacity, info.capacity - info.free, info.available};
}

}  // namespace vault::server
