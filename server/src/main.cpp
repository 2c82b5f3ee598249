#include "auth_service.hpp"
#include "chunk_upload_manager.hpp"
#include "command_router.hpp"
#include "config_loader.hpp"
#include "jwt_service.hpp"
#include "logger.hpp"
#include "single_file_upload.hpp"
#include "storage_tree.hpp"
#include "task_executor.hpp"
#include "vault_server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> g_should_run{true};

void handle_signal(int) {
    g_should_run = false;
}
}  // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "server/config/vault.conf";

    try {
        using namespace vault::server;

        auto config = load_config(config_path);
        Logger logger(config.log_file);

        AuthService auth(config.database_file);
        auth.initialize_schema();
        auth.ensure_admin(config.admin_username, config.admin_password);
        JwtService jwt({.issuer = config.jwt_issuer,
                        .secret = config.jwt_secret,
                        .ttl_seconds = config.token_ttl_seconds});

        const std::filesystem::path storage_root(config.storage_root);
        StorageTree tree(storage_root / "users",
                         PathResolver({.max_path_length = config.max_path_length,
                                       .max_component_length = config.max_component_length}),
                         logger);
        ChunkUploadManager uploads(tree,
                                   storage_root / "staging",
                                   {.max_chunk_bytes = config.max_chunk_bytes,
                                    .max_upload_bytes = config.max_upload_bytes,
                                    .max_chunks = config.max_chunks_per_upload,
                                    .idle_timeout = std::chrono::seconds(config.session_idle_timeout_seconds)},
                                   logger);
        uploads.start_sweeper(std::chrono::seconds(config.sweep_interval_seconds));
        SingleFileUpload single_upload(tree, config.max_small_upload_bytes, logger);

        TaskExecutor executor(logger);
        CommandRouter router(auth, jwt, tree, uploads, single_upload, executor, logger, config.max_chunk_bytes);
        VaultServer server(config, router, executor, logger);
        server.start();

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        std::cout << "Vault drive server started. Press Ctrl+C to stop." << std::endl;
        while (g_should_run.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        std::cout << "Stopping server..." << std::endl;
        server.stop();
        uploads.stop_sweeper();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
