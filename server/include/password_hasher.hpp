#pragma once

#include <string>

namespace vault::server {

class PasswordHasher {
public:
    static std::string generate_salt();
    static std::string hash_password(const std::string& password, const std::string& salt);
    static bool verify(const std::string& password, const std::string& salt, const std::string& expected_hash);
};

}  // namespace vault::server
