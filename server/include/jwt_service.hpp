#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vault::server {

struct JwtConfig {
    std::string issuer = "vault-drive";
    std::string secret;
    uint32_t ttl_seconds = 3600;
};

struct JwtClaims {
    std::string subject;  // user id
    bool is_admin = false;
    std::uint64_t expires_at{};
    std::uint64_t issued_at{};
};

class JwtService {
public:
    explicit JwtService(JwtConfig config);

    std::string issue(std::int64_t user_id, bool is_admin) const;
    std::optional<JwtClaims> verify(const std::string& token) const;

private:
    std::string sign(const std::string& signing_input) const;
    static std::string base64url_encode(std::string_view input);
    static std::string base64url_decode(const std::string& input);
    static std::string escape_json(const std::string& raw);

    JwtConfig config_;
};

}  // namespace vault::server
