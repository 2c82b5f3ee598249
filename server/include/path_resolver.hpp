#pragma once

#include "storage_error.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace vault::server {

// Prefix of the temporary siblings written by StorageTree::put. Users can never address these names.
inline constexpr std::string_view kTempPrefix = ".vault-part-";

struct PathLimits {
    std::size_t max_path_length = 4096;
    std::size_t max_component_length = 255;
};

struct ResolvedPath {
    std::vector<std::string> segments;
    std::filesystem::path absolute;

    bool is_root() const { return segments.empty(); }
    std::string relative() const;
    std::string name() const { return segments.empty() ? std::string() : segments.back(); }
};

// Validates untrusted relative paths against a user root.
//
// A path is accepted only if it is lexically confined to the root (no "..", no absolute or
// drive prefix, no separators hidden behind percent-encoding) and the real location of its
// longest existing prefix still lies under the real root once symlinks are followed.
class PathResolver {
public:
    explicit PathResolver(PathLimits limits = {});

    Result<std::vector<std::string>> split(std::string_view raw_path) const;

    Result<ResolvedPath> resolve(const std::filesystem::path& user_root,
                                 std::string_view raw_path,
                                 bool allow_root = false) const;
    Result<ResolvedPath> resolve_segments(const std::filesystem::path& user_root,
                                          std::vector<std::string> segments,
                                          bool allow_root = false) const;

    const PathLimits& limits() const { return limits_; }

private:
    Status check_segment(std::string_view segment, bool first) const;
    Status check_real_location(const std::filesystem::path& user_root,
                               const std::filesystem::path& absolute,
                               bool is_root) const;

    PathLimits limits_;
};

}  // namespace vault::server
