#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace vault::server {

struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 6000;
    std::size_t max_clients = 512;
    std::string storage_root = "./server/storage";
    std::string database_file = "./data/vault.db";
    std::string log_file = "./data/server.log";
    std::size_t long_task_threads = 4;

    std::size_t max_chunk_bytes = 8 * 1024 * 1024;
    std::uint64_t max_small_upload_bytes = 64ULL * 1024 * 1024;
    std::uint64_t max_upload_bytes = 20ULL * 1024 * 1024 * 1024;
    std::uint64_t max_chunks_per_upload = 1 << 20;
    std::size_t max_path_length = 4096;
    std::size_t max_component_length = 255;
    uint32_t session_idle_timeout_seconds = 30 * 60;
    uint32_t sweep_interval_seconds = 60;

    std::string admin_username = "joey";
    std::string admin_password = "change-me-now";
    std::string jwt_secret = "change-me";
    std::string jwt_issuer = "vault-drive";
    uint32_t token_ttl_seconds = 3600;
};

ServerConfig load_config(const std::string& path);

}  // namespace vault::server
