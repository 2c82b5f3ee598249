#include "config_loader.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace vault::server {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::uint64_t parse_number(const std::string& key, const std::string& value, std::uint64_t min, std::uint64_t max) {
    std::size_t consumed = 0;
    std::uint64_t parsed = 0;
    try {
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid numeric value for " + key + ": " + value);
    }
    if (consumed != value.size() || value.front() == '-' || parsed < min || parsed > max) {
        throw std::runtime_error("Invalid numeric value for " + key + ": " + value);
    }
    return parsed;
}

template <typename T>
void assign_number(T& field, const std::string& key, const std::string& value, std::uint64_t min = 0) {
    field = static_cast<T>(parse_number(key, value, min, std::numeric_limits<T>::max()));
}

}  // namespace

ServerConfig load_config(const std::string& path) {
    ServerConfig config;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults" << std::endl;
        return config;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, equals_pos));
        const std::string value = trim(line.substr(equals_pos + 1));

        if (key == "listen_address") {
            config.listen_address = value;
        } else if (key == "listen_port") {
            assign_number(config.listen_port, key, value);
        } else if (key == "max_clients") {
            assign_number(config.max_clients, key, value);
        } else if (key == "storage_root") {
            config.storage_root = value;
        } else if (key == "database_file") {
            config.database_file = value;
        } else if (key == "log_file") {
            config.log_file = value;
        } else if (key == "long_task_threads") {
            assign_number(config.long_task_threads, key, value);
        } else if (key == "max_chunk_bytes") {
            assign_number(config.max_chunk_bytes, key, value);
        } else if (key == "max_small_upload_bytes") {
            assign_number(config.max_small_upload_bytes, key, value);
        } else if (key == "max_upload_bytes") {
            assign_number(config.max_upload_bytes, key, value);
        } else if (key == "max_chunks_per_upload") {
            assign_number(config.max_chunks_per_upload, key, value);
        } else if (key == "max_path_length") {
            assign_number(config.max_path_length, key, value);
        } else if (key == "max_component_length") {
            assign_number(config.max_component_length, key, value);
        } else if (key == "session_idle_timeout_seconds") {
            assign_number(config.session_idle_timeout_seconds, key, value);
        } else if (key == "sweep_interval_seconds") {
            assign_number(config.sweep_interval_seconds, key, value, 1);
        } else if (key == "admin_username") {
            config.admin_username = value;
        } else if (key == "admin_password") {
            config.admin_password = value;
        } else if (key == "jwt_secret") {
            config.jwt_secret = value;
        } else if (key == "jwt_issuer") {
            config.jwt_issuer = value;
        } else if (key == "token_ttl_seconds") {
            assign_number(config.token_ttl_seconds, key, value);
        } else {
            std::cerr << "[WARN] Unknown config key " << key << " ignored" << std::endl;
        }
    }

    return config;
}

}  // namespace vault::server
