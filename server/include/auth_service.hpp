#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vault::server {

struct UserRecord {
    std::int64_t id = 0;
    std::string username;
    std::string password_hash;
    std::string salt;
    bool is_admin = false;
};

// Account store. Storage code only ever sees the numeric id it hands out.
class AuthService {
public:
    explicit AuthService(const std::string& database_path);
    ~AuthService();

    AuthService(const AuthService&) = delete;
    AuthService& operator=(const AuthService&) = delete;

    void initialize_schema();
    // Creates the bootstrap admin account if no user has that name yet.
    void ensure_admin(const std::string& username, const std::string& password);

    std::optional<std::int64_t> register_user(const std::string& username, const std::string& password);
    std::optional<UserRecord> authenticate(const std::string& username, const std::string& password);
    std::optional<UserRecord> find_by_id(std::int64_t id);
    std::vector<UserRecord> list_users();

private:
    std::optional<UserRecord> find_user(const std::string& username);
    std::optional<std::int64_t> insert_user(const std::string& username, const std::string& password, bool is_admin);

    std::mutex mutex_;
    sqlite3* db_{};
};

}  // namespace vault::server
