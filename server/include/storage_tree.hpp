#pragma once

#include "logger.hpp"
#include "path_resolver.hpp"
#include "storage_error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vault::server {

enum class NodeKind {
    kFile,
    kFolder,
};

inline std::string_view kind_name(NodeKind kind) {
    return kind == NodeKind::kFolder ? "dir" : "file";
}

struct StorageNode {
    std::string name;
    NodeKind kind;
    std::uint64_t size;
    std::int64_t modified;
};

struct NodeInfo {
    std::string path;
    NodeKind kind;
    std::uint64_t size;
    std::int64_t modified;
};

struct TreeNode {
    std::string name;
    std::string path;
    NodeKind kind;
    std::uint64_t size;
    std::vector<TreeNode> children;
};

struct UsageStats {
    std::uint64_t used_bytes = 0;
    std::uint64_t file_count = 0;
};

struct DiskStats {
    std::uint64_t capacity = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
};

// Pull-based byte stream consumed by StorageTree::put.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    // Fills up to buffer.size() bytes and returns the count, 0 at end of stream. Throws on read errors.
    virtual std::size_t read(std::span<std::byte> buffer) = 0;
};

class BufferSource : public ByteSource {
public:
    explicit BufferSource(std::span<const std::byte> data) : data_(data) {}
    std::size_t read(std::span<std::byte> buffer) override;

private:
    std::span<const std::byte> data_;
    std::size_t offset_ = 0;
};

// Per-user directory hierarchy. Every call resolves its raw paths through PathResolver against
// `<users_root>/user_<id>` before any filesystem access.
class StorageTree {
public:
    StorageTree(std::filesystem::path users_root, PathResolver resolver, Logger& logger);

    std::filesystem::path user_root(const std::string& user_id) const;
    Result<ResolvedPath> resolve(const std::string& user_id, std::string_view raw_path, bool allow_root = false);
    Result<ResolvedPath> resolve_segments(const std::string& user_id,
                                          std::vector<std::string> segments,
                                          bool allow_root = false);
    // Resolves `raw_path` relative to an already resolved folder of the same user.
    Result<ResolvedPath> resolve_under(const std::string& user_id, const ResolvedPath& base, std::string_view raw_path);

    Result<std::vector<StorageNode>> list(const std::string& user_id, std::string_view raw_path);
    Result<TreeNode> walk(const std::string& user_id, std::string_view raw_path);
    Result<NodeInfo> stat(const std::string& user_id, std::string_view raw_path);

    Status create_folder(const std::string& user_id, std::string_view raw_path);
    Status remove(const std::string& user_id, std::string_view raw_path);
    Status rename(const std::string& user_id, std::string_view old_path, std::string_view new_path);
    Status rename_entry(const std::string& user_id, std::string_view raw_path, std::string_view new_name);
    Status move(const std::string& user_id, std::string_view old_path, std::string_view new_folder);

    Result<NodeInfo> put(const std::string& user_id, std::string_view raw_path, ByteSource& source);
    Result<NodeInfo> put(const ResolvedPath& destination, ByteSource& source);

    Result<std::vector<std::byte>> read(const std::string& user_id,
                                        std::string_view raw_path,
                                        std::uint64_t offset,
                                        std::size_t length);

    Result<UsageStats> usage(const std::string& user_id);
    Result<DiskStats> disk_stats() const;

    const PathResolver& resolver() const { return resolver_; }

private:
    Status ensure_user_root(const std::string& user_id);
    Status ensure_parents(const ResolvedPath& target);
    Status rename_resolved(const ResolvedPath& from, const ResolvedPath& to);
    Result<NodeInfo> describe(const ResolvedPath& target) const;
    TreeNode walk_folder(const std::filesystem::path& root, const ResolvedPath& folder) const;
    bool is_listable(const std::filesystem::path& root,
                     const ResolvedPath& folder,
                     const std::filesystem::directory_entry& entry) const;
    StorageError report(const std::string& user_id, StorageError error) const;

    std::filesystem::path users_root_;
    PathResolver resolver_;
    Logger& logger_;
};

}  // namespace vault::server
