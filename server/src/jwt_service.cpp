#include "jwt_service.hpp"

#include "random_id.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <cctype>
#include <chrono>
#include <sstream>
#include <vector>

namespace vault::server {

namespace {

std::uint64_t now_seconds() {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string find_json_string(const std::string& payload, const std::string& key) {
    const std::string pattern = "\"" + key + "\":\"";
    const auto pos = payload.find(pattern);
    if (pos == std::string::npos) {
        return {};
    }
    std::string value;
    for (std::size_t i = pos + pattern.size(); i < payload.size(); ++i) {
        const char ch = payload[i];
        if (ch == '\\' && i + 1 < payload.size()) {
            value.push_back(payload[++i]);
        } else if (ch == '"') {
            return value;
        } else {
            value.push_back(ch);
        }
    }
    return {};
}

std::uint64_t find_json_number(const std::string& payload, const std::string& key) {
    const std::string pattern = "\"" + key + "\":";
    const auto pos = payload.find(pattern);
    if (pos == std::string::npos) {
        return 0;
    }
    std::uint64_t value = 0;
    for (std::size_t i = pos + pattern.size(); i < payload.size(); ++i) {
        const auto ch = static_cast<unsigned char>(payload[i]);
        if (!std::isdigit(ch)) {
            break;
        }
        value = value * 10 + (ch - '0');
    }
    return value;
}

bool find_json_bool(const std::string& payload, const std::string& key) {
    return payload.find("\"" + key + "\":true") != std::string::npos;
}

}  // namespace

JwtService::JwtService(JwtConfig config) : config_(std::move(config)) {}

std::string JwtService::escape_json(const std::string& raw) {
    std::string escaped;
    escaped.reserve(raw.size());
    for (char ch : raw) {
        if (ch == '"' || ch == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

std::string JwtService::base64url_encode(std::string_view input) {
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(input.data()),
                                        static_cast<int>(input.size()));
    std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
    for (char& ch : encoded) {
        if (ch == '+') {
            ch = '-';
        } else if (ch == '/') {
            ch = '_';
        }
    }
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

// Returns an empty string for input that is not valid base64url.
std::string JwtService::base64url_decode(const std::string& input) {
    std::string standard = input;
    for (char& ch : standard) {
        if (ch == '-') {
            ch = '+';
        } else if (ch == '_') {
            ch = '/';
        }
    }
    std::size_t padding = 0;
    while (standard.size() % 4 != 0) {
        standard.push_back('=');
        ++padding;
    }
    if (padding == 3) {
        return {};
    }
    std::vector<unsigned char> out(standard.size() / 4 * 3 + 1);
    const int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                                        static_cast<int>(standard.size()));
    if (written < 0 || static_cast<std::size_t>(written) < padding) {
        return {};
    }
    // EVP_DecodeBlock keeps the zero bytes produced by padding.
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written) - padding);
}

std::string JwtService::sign(const std::string& signing_input) const {
    unsigned int len = 0;
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    HMAC(EVP_sha256(), config_.secret.data(), static_cast<int>(config_.secret.size()),
         reinterpret_cast<const unsigned char*>(signing_input.data()),
         signing_input.size(), digest.data(), &len);
    return base64url_encode(std::string_view(reinterpret_cast<const char*>(digest.data()), len));
}

std::string JwtService::issue(std::int64_t user_id, bool is_admin) const {
    const auto now = now_seconds();
    const auto exp = now + config_.ttl_seconds;

    const std::string header = R"({"alg":"HS256","typ":"JWT"})";
    std::ostringstream payload;
    payload << "{\"iss\":\"" << escape_json(config_.issuer) << "\","
            << "\"sub\":\"" << user_id << "\","
            << "\"adm\":" << (is_admin ? "true" : "false") << ","
            << "\"iat\":" << now << ","
            << "\"exp\":" << exp << ","
            << "\"jti\":\"" << random_hex(16) << "\"}";

    const std::string signing_input = base64url_encode(header) + "." + base64url_encode(payload.str());
    return signing_input + "." + sign(signing_input);
}

std::optional<JwtClaims> JwtService::verify(const std::string& token) const {
    const auto first_dot = token.find('.');
    if (first_dot == std::string::npos) {
        return std::nullopt;
    }
    const auto second_dot = token.find('.', first_dot + 1);
    if (second_dot == std::string::npos) {
        return std::nullopt;
    }

    const std::string header_part = token.substr(0, first_dot);
    const std::string payload_part = token.substr(first_dot + 1, second_dot - first_dot - 1);
    const std::string signature_part = token.substr(second_dot + 1);

    if (base64url_decode(header_part).find("\"HS256\"") == std::string::npos) {
        return std::nullopt;
    }

    const std::string expected = sign(header_part + "." + payload_part);
    if (expected.size() != signature_part.size() ||
        CRYPTO_memcmp(expected.data(), signature_part.data(), expected.size()) != 0) {
        return std::nullopt;
    }

    const std::string payload = base64url_decode(payload_part);
    if (find_json_string(payload, "iss") != config_.issuer) {
        return std::nullopt;
    }

    JwtClaims claims;
    claims.subject = find_json_string(payload, "sub");
    claims.is_admin = find_json_bool(payload, "adm");
    claims.issued_at = find_json_number(payload, "iat");
    claims.expires_at = find_json_number(payload, "exp");

    if (claims.subject.empty() || claims.expires_at == 0) {
        return std::nullopt;
    }
    if (claims.expires_at < now_seconds()) {
        return std::nullopt;
    }
    return claims;
}

}  // namespace vault::server
