#include "path_resolver.hpp"

#include <algorithm>
#include <cctype>

namespace vault::server {

namespace {

bool is_separator(char ch) {
    return ch == '/' || ch == '\\';
}

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

// Repeatedly decodes %XX escapes so "%252e%252e" cannot sneak past a second decoding layer.
std::string percent_decode(std::string_view input) {
    std::string current(input);
    for (int round = 0; round < 4; ++round) {
        if (current.find('%') == std::string::npos) {
            break;
        }
        std::string decoded;
        decoded.reserve(current.size());
        for (std::size_t i = 0; i < current.size(); ++i) {
            if (current[i] == '%' && i + 2 < current.size()) {
                const int hi = hex_value(current[i + 1]);
                const int lo = hex_value(current[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    decoded.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            decoded.push_back(current[i]);
        }
        if (decoded == current) {
            break;
        }
        current = std::move(decoded);
    }
    return current;
}

bool has_control(std::string_view value) {
    for (char ch : value) {
        const auto uch = static_cast<unsigned char>(ch);
        if (uch < 0x20 || uch == 0x7f) {
            return true;
        }
    }
    return false;
}

bool is_drive_marker(std::string_view segment) {
    return segment.size() >= 2 && std::isalpha(static_cast<unsigned char>(segment[0])) && segment[1] == ':';
}

// Component-wise containment, so "/data/user_1" never matches "/data/user_10".
bool is_within(const std::filesystem::path& root, const std::filesystem::path& target, bool allow_equal) {
    std::vector<std::filesystem::path> root_parts;
    std::vector<std::filesystem::path> target_parts;
    for (const auto& part : root) {
        if (!part.empty()) {
            root_parts.push_back(part);
        }
    }
    for (const auto& part : target) {
        if (!part.empty()) {
            target_parts.push_back(part);
        }
    }
    if (target_parts.size() < root_parts.size()) {
        return false;
    }
    if (!std::equal(root_parts.begin(), root_parts.end(), target_parts.begin())) {
        return false;
    }
    return allow_equal || target_parts.size() > root_parts.size();
}

}  // namespace

std::string ResolvedPath::relative() const {
    std::string joined;
    for (const auto& segment : segments) {
        if (!joined.empty()) {
            joined.push_back('/');
        }
        joined.append(segment);
    }
    return joined;
}

PathResolver::PathResolver(PathLimits limits) : limits_(limits) {}

Status PathResolver::check_segment(std::string_view segment, bool first) const {
    if (segment == "..") {
        return make_error(StorageErrc::kTraversal, "parent segment");
    }
    if (first && is_drive_marker(segment)) {
        return make_error(StorageErrc::kTraversal, "drive prefix");
    }
    if (has_control(segment)) {
        return make_error(StorageErrc::kMalformed, "control character");
    }
    const auto decoded = percent_decode(segment);
    if (decoded == "..") {
        return make_error(StorageErrc::kTraversal, "encoded parent segment");
    }
    for (char ch : decoded) {
        if (is_separator(ch)) {
            return make_error(StorageErrc::kTraversal, "encoded separator");
        }
    }
    if (decoded.find('\0') != std::string::npos || has_control(decoded)) {
        return make_error(StorageErrc::kMalformed, "encoded control character");
    }
    if (segment.size() > limits_.max_component_length) {
        return make_error(StorageErrc::kTooLong, "component too long");
    }
    if (segment.substr(0, kTempPrefix.size()) == kTempPrefix) {
        return make_error(StorageErrc::kMalformed, "reserved name");
    }
    return ok_status();
}

Result<std::vector<std::string>> PathResolver::split(std::string_view raw_path) const {
    if (raw_path.find('\0') != std::string_view::npos) {
        return make_error(StorageErrc::kMalformed, "embedded null byte");
    }
    if (!raw_path.empty() && is_separator(raw_path.front())) {
        return make_error(StorageErrc::kTraversal, "absolute path");
    }

    std::vector<std::string> segments;
    std::size_t total = 0;
    std::size_t start = 0;
    while (start <= raw_path.size()) {
        std::size_t end = start;
        while (end < raw_path.size() && !is_separator(raw_path[end])) {
            ++end;
        }
        const auto segment = raw_path.substr(start, end - start);
        start = end + 1;
        if (segment.empty() || segment == ".") {
            continue;
        }
        auto status = check_segment(segment, segments.empty());
        if (!status) {
            return status.error();
        }
        total += segment.size() + (segments.empty() ? 0 : 1);
        if (total > limits_.max_path_length) {
            return make_error(StorageErrc::kTooLong, "path too long");
        }
        segments.emplace_back(segment);
    }
    return segments;
}

Result<ResolvedPath> PathResolver::resolve(const std::filesystem::path& user_root,
                                           std::string_view raw_path,
                                           bool allow_root) const {
    auto segments = split(raw_path);
    if (!segments) {
        return segments.error();
    }
    return resolve_segments(user_root, std::move(segments.value()), allow_root);
}

Result<ResolvedPath> PathResolver::resolve_segments(const std::filesystem::path& user_root,
                                                    std::vector<std::string> segments,
                                                    bool allow_root) const {
    if (segments.empty() && !allow_root) {
        return make_error(StorageErrc::kMalformed, "empty path");
    }
    ResolvedPath resolved;
    resolved.absolute = user_root;
    std::size_t total = 0;
    for (const auto& segment : segments) {
        // Segments joined by callers (move, batch uploads) get the same checks as parsed ones.
        if (segment.empty() || segment == "." || is_separator(segment.front()) ||
            segment.find_first_of("/\\") != std::string::npos) {
            return make_error(StorageErrc::kMalformed, "invalid segment");
        }
        auto status = check_segment(segment, &segment == &segments.front());
        if (!status) {
            return status.error();
        }
        total += segment.size() + 1;
        resolved.absolute /= segment;
    }
    if (total > limits_.max_path_length + 1) {
        return make_error(StorageErrc::kTooLong, "path too long");
    }
    resolved.segments = std::move(segments);

    auto real = check_real_location(user_root, resolved.absolute, resolved.is_root());
    if (!real) {
        return real.error();
    }
    return resolved;
}

Status PathResolver::check_real_location(const std::filesystem::path& user_root,
                                         const std::filesystem::path& absolute,
                                         bool is_root) const {
    std::error_code ec;
    const auto real_root = std::filesystem::weakly_canonical(user_root, ec);
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "cannot resolve user root: " + ec.message());
    }
    const auto real_target = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return make_error(StorageErrc::kIoFailure, "cannot resolve target: " + ec.message());
    }
    if (!is_within(real_root, real_target, is_root)) {
        return make_error(StorageErrc::kTraversal, "symlink escapes user root");
    }
    return ok_status();
}

}  // namespace vault::server
