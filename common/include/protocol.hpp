#pragma once

#include <arpa/inet.h>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vault::protocol {

inline constexpr uint32_t kMagic = 0x564C5444;  // "V L T D"
inline constexpr uint16_t kVersion = 1;
inline constexpr std::size_t kMaxHeaderBytes = 0xFFFF;

using HeaderMap = std::unordered_map<std::string, std::string>;

struct Message {
    HeaderMap headers;
    std::vector<std::byte> body;
};

// Thrown for frames that can never be decoded; the connection must be dropped.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace detail {
struct WireHeader {
    uint32_t magic;
    uint16_t version;
    uint16_t header_size;
    uint32_t body_size;
};

inline std::string serialize_headers(const HeaderMap& headers) {
    std::string encoded;
    for (const auto& entry : headers) {
        if (entry.first.find_first_of("=\n") != std::string::npos ||
            entry.second.find('\n') != std::string::npos) {
            throw std::invalid_argument("Header " + entry.first + " cannot be framed");
        }
        encoded.append(entry.first);
        encoded.push_back('=');
        encoded.append(entry.second);
        encoded.push_back('\n');
    }
    return encoded;
}

inline HeaderMap parse_headers(std::string_view data) {
    HeaderMap headers;
    std::size_t start = 0;
    while (start < data.size()) {
        const auto end = data.find('\n', start);
        const auto line_end = end == std::string_view::npos ? data.size() : end;
        if (line_end == start) {
            break;
        }
        const auto sep = data.find('=', start);
        if (sep != std::string_view::npos && sep < line_end) {
            headers.emplace(std::string(data.substr(start, sep - start)),
                            std::string(data.substr(sep + 1, line_end - sep - 1)));
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return headers;
}

}  // namespace detail

inline Message make_message(std::initializer_list<std::pair<std::string, std::string>> headers,
                            std::vector<std::byte> body = {}) {
    Message msg;
    for (const auto& entry : headers) {
        msg.headers.emplace(entry.first, entry.second);
    }
    msg.body = std::move(body);
    return msg;
}

inline std::string_view header_value(const Message& msg, const std::string& key,
                                     std::string_view fallback = {}) {
    auto it = msg.headers.find(key);
    if (it == msg.headers.end()) {
        return fallback;
    }
    return it->second;
}

// Parses a decimal header. Absent, out-of-range or partly numeric values yield nullopt.
template <typename Integer>
std::optional<Integer> header_number(const Message& msg, const std::string& key) {
    const auto text = header_value(msg, key);
    if (text.empty()) {
        return std::nullopt;
    }
    Integer value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

inline std::vector<std::byte> encode(const Message& message) {
    const auto header_blob = detail::serialize_headers(message.headers);
    if (header_blob.size() > kMaxHeaderBytes) {
        throw std::length_error("Header block exceeds frame limit");
    }
    if (message.body.size() > UINT32_MAX) {
        throw std::length_error("Body exceeds frame limit");
    }
    detail::WireHeader wire{};
    wire.magic = htonl(kMagic);
    wire.version = htons(kVersion);
    wire.header_size = htons(static_cast<uint16_t>(header_blob.size()));
    wire.body_size = htonl(static_cast<uint32_t>(message.body.size()));

    std::vector<std::byte> buffer(sizeof(detail::WireHeader) + header_blob.size() + message.body.size());
    std::memcpy(buffer.data(), &wire, sizeof(detail::WireHeader));
    std::memcpy(buffer.data() + sizeof(detail::WireHeader), header_blob.data(), header_blob.size());
    if (!message.body.empty()) {
        std::memcpy(buffer.data() + sizeof(detail::WireHeader) + header_blob.size(), message.body.data(),
                    message.body.size());
    }
    return buffer;
}

// Decodes one frame starting at `offset`. Returns false until a whole frame is buffered. Throws
// ProtocolError on a bad magic or version, or when the declared body exceeds `max_body_bytes`, which
// is checked before the body arrives.
inline bool try_decode(std::vector<std::byte>& buffer, std::size_t& offset, Message& out,
                       std::size_t max_body_bytes) {
    const auto available = buffer.size() - offset;
    if (available < sizeof(detail::WireHeader)) {
        return false;
    }
    detail::WireHeader wire{};
    std::memcpy(&wire, buffer.data() + offset, sizeof(detail::WireHeader));

    const uint32_t magic = ntohl(wire.magic);
    const uint16_t version = ntohs(wire.version);
    const uint16_t header_size = ntohs(wire.header_size);
    const uint32_t body_size = ntohl(wire.body_size);

    if (magic != kMagic) {
        throw ProtocolError("Protocol magic mismatch");
    }
    if (version != kVersion) {
        throw ProtocolError("Unsupported protocol version");
    }
    if (body_size > max_body_bytes) {
        throw ProtocolError("Frame body of " + std::to_string(body_size) + " bytes exceeds limit");
    }

    const std::size_t frame_size = sizeof(detail::WireHeader) + header_size + body_size;
    if (available < frame_size) {
        return false;
    }

    const auto* header_begin = buffer.data() + offset + sizeof(detail::WireHeader);
    std::string header_blob(reinterpret_cast<const char*>(header_begin), header_size);
    out.headers = detail::parse_headers(header_blob);

    out.body.resize(body_size);
    if (body_size > 0) {
        const auto* body_begin = header_begin + header_size;
        std::memcpy(out.body.data(), body_begin, body_size);
    }

    offset += frame_size;
    if (offset > 0 && offset > buffer.size() / 2) {
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));
        offset = 0;
    }
    return true;
}

}  // namespace vault::protocol
