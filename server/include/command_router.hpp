#pragma once

#include "auth_service.hpp"
#include "chunk_upload_manager.hpp"
#include "jwt_service.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "single_file_upload.hpp"
#include "storage_tree.hpp"
#include "task_executor.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace vault::server {

struct ClientSession {
    std::string peer;
    std::string user_id;
    bool is_admin = false;
};

// Maps protocol requests onto the storage core. Replies may be delivered from a TaskExecutor
// worker, so `Reply` must be safe to call from any thread.
class CommandRouter {
public:
    using Reply = std::function<void(protocol::Message)>;

    CommandRouter(AuthService& auth,
                  JwtService& jwt,
                  StorageTree& tree,
                  ChunkUploadManager& uploads,
                  SingleFileUpload& single_upload,
                  TaskExecutor& executor,
                  Logger& logger,
                  std::size_t max_fetch_bytes);

    void dispatch(ClientSession& client, const protocol::Message& request, const Reply& reply);

private:
    bool handle_auth(ClientSession& client, const std::string& command, const protocol::Message& request,
                     const Reply& reply);
    bool handle_tree(const ClientSession& client, const std::string& command, const protocol::Message& request,
                     const Reply& reply);
    bool handle_upload(const ClientSession& client, const std::string& command, const protocol::Message& request,
                       const Reply& reply);
    void handle_batch(const ClientSession& client, const protocol::Message& request, const Reply& reply);
    void handle_stats(const ClientSession& client, const Reply& reply);

    protocol::Message failure(const std::string& command, const ClientSession& client, const StorageError& error);

    AuthService& auth_;
    JwtService& jwt_;
    StorageTree& tree_;
    ChunkUploadManager& uploads_;
    SingleFileUpload& single_upload_;
    TaskExecutor& executor_;
    Logger& logger_;
    std::size_t max_fetch_bytes_;
};

}  // namespace vault::server
