#include "auth_service.hpp"

#include "password_hasher.hpp"

#include <filesystem>
#include <stdexcept>

namespace vault::server {

namespace {

constexpr const char* kUserColumns = "SELECT id,username,password_hash,salt,is_admin FROM users ";

UserRecord read_user(sqlite3_stmt* stmt) {
    UserRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.username = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    record.password_hash = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
    record.salt = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
    record.is_admin = sqlite3_column_int(stmt, 4) != 0;
    return record;
}

}  // namespace

AuthService::AuthService(const std::string& database_path) {
    const auto parent = std::filesystem::path(database_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    if (sqlite3_open(database_path.c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + message);
    }
}

AuthService::~AuthService() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void AuthService::initialize_schema() {
    const char* ddl = R"SQL(
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            username TEXT UNIQUE NOT NULL,
            password_hash TEXT NOT NULL,
            salt TEXT NOT NULL,
            is_admin INTEGER NOT NULL DEFAULT 0,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        );
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, ddl, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string error(err_msg ? err_msg : "unknown error");
        sqlite3_free(err_msg);
        throw std::runtime_error("Failed to initialize schema: " + error);
    }
}

void AuthService::ensure_admin(const std::string& username, const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (find_user(username).has_value()) {
        return;
    }
    if (!insert_user(username, password, true)) {
        throw std::runtime_error("Failed to create admin account " + username);
    }
}

std::optional<std::int64_t> AuthService::register_user(const std::string& username, const std::string& password) {
    if (username.empty() || password.empty()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (find_user(username).has_value()) {
        return std::nullopt;
    }
    return insert_user(username, password, false);
}

std::optional<std::int64_t> AuthService::insert_user(const std::string& username,
                                                     const std::string& password,
                                                     bool is_admin) {
    const std::string salt = PasswordHasher::generate_salt();
    const std::string hash = PasswordHasher::hash_password(password, salt);

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "INSERT INTO users(username, password_hash, salt, is_admin) VALUES(?,?,?,?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, hash.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, salt.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, is_admin ? 1 : 0);

    const bool success = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    if (!success) {
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::optional<UserRecord> AuthService::authenticate(const std::string& username, const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = find_user(username);
    if (!record.has_value()) {
        return std::nullopt;
    }
    if (!PasswordHasher::verify(password, record->salt, record->password_hash)) {
        return std::nullopt;
    }
    return record;
}

std::optional<UserRecord> AuthService::find_user(const std::string& username) {
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = std::string(kUserColumns) + "WHERE username=?";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, username.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<UserRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        record = read_user(stmt);
    }
    sqlite3_finalize(stmt);
    return record;
}

std::optional<UserRecord> AuthService::find_by_id(std::int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = std::string(kUserColumns) + "WHERE id=?";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_int64(stmt, 1, id);

    std::optional<UserRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        record = read_user(stmt);
    }
    sqlite3_finalize(stmt);
    return record;
}

std::vector<UserRecord> AuthService::list_users() {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = std::string(kUserColumns) + "ORDER BY is_admin DESC, username ASC";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to list users: " + std::string(sqlite3_errmsg(db_)));
    }
    std::vector<UserRecord> users;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        users.push_back(read_user(stmt));
    }
    sqlite3_finalize(stmt);
    return users;
}

}  // namespace vault::server
