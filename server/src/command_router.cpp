#include "command_router.hpp"

#include <algorithm>
#include <memory>
#include <span>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace vault::server {

namespace {

std::vector<std::byte> to_bytes(const std::string& text) {
    return std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                  reinterpret_cast<const std::byte*>(text.data() + text.size()));
}

protocol::Message status_message(const std::string& command, std::string_view status) {
    return protocol::make_message({{"cmd", command}, {"status", std::string(status)}});
}

// False when the header is present but not a number.
bool optional_count(const protocol::Message& request, const std::string& key, std::optional<std::uint64_t>& out) {
    if (protocol::header_value(request, key).empty()) {
        out.reset();
        return true;
    }
    out = protocol::header_number<std::uint64_t>(request, key);
    return out.has_value();
}

void append_tree(const TreeNode& node, std::ostringstream& body, std::size_t& count) {
    for (const auto& child : node.children) {
        body << child.path << "|" << kind_name(child.kind) << "|" << child.size << "\n";
        ++count;
        append_tree(child, body, count);
    }
}

std::string join_indices(const std::vector<std::uint64_t>& indices) {
    std::string joined;
    for (const auto index : indices) {
        if (!joined.empty()) {
            joined.push_back(',');
        }
        joined += std::to_string(index);
    }
    return joined;
}

}  // namespace

CommandRouter::CommandRouter(AuthService& auth,
                             JwtService& jwt,
                             StorageTree& tree,
                             ChunkUploadManager& uploads,
                             SingleFileUpload& single_upload,
                             TaskExecutor& executor,
                             Logger& logger,
                             std::size_t max_fetch_bytes)
    : auth_(auth),
      jwt_(jwt),
      tree_(tree),
      uploads_(uploads),
      single_upload_(single_upload),
      executor_(executor),
      logger_(logger),
      max_fetch_bytes_(max_fetch_bytes) {}

protocol::Message CommandRouter::failure(const std::string& command,
                                         const ClientSession& client,
                                         const StorageError& error) {
    if (error.code == StorageErrc::kIoFailure) {
        logger_.error(command + " for user " + client.user_id + " failed: " + error.detail);
    }
    return status_message(command, status_name(error.code));
}

void CommandRouter::dispatch(ClientSession& client, const protocol::Message& request, const Reply& reply) {
    const std::string command(protocol::header_value(request, "cmd"));
    if (command.empty()) {
        reply(status_message("ERROR", "missing_command"));
        return;
    }
    try {
        if (handle_auth(client, command, request, reply)) {
            return;
        }

        const auto token = protocol::header_value(request, "token");
        if (token.empty()) {
            reply(status_message(command, "auth_required"));
            return;
        }
        auto claims = jwt_.verify(std::string(token));
        if (!claims) {
            reply(status_message(command, "token_invalid"));
            return;
        }
        client.user_id = claims->subject;
        client.is_admin = claims->is_admin;

        if (handle_tree(client, command, request, reply) || handle_upload(client, command, request, reply)) {
            return;
        }
        if (command == "STORAGE_STATS") {
            handle_stats(client, reply);
            return;
        }
        reply(status_message(command, "unknown"));
    } catch (const std::exception& ex) {
        logger_.error("Command " + command + " from " + client.peer + " failed: " + ex.what());
        reply(status_message(command, "error"));
    }
}

bool CommandRouter::handle_auth(ClientSession& client,
                                const std::string& command,
                                const protocol::Message& request,
                                const Reply& reply) {
    if (command == "REGISTER") {
        const std::string username(protocol::header_value(request, "username"));
        const std::string password(protocol::header_value(request, "password"));
        if (username.empty() || password.empty()) {
            reply(status_message(command, "invalid"));
            return true;
        }
        auto id = auth_.register_user(username, password);
        if (!id) {
            reply(status_message(command, "exists"));
            return true;
        }
        logger_.info("Registered user " + username + " as id " + std::to_string(*id));
        reply(protocol::make_message({{"cmd", command}, {"status", "ok"}, {"user_id", std::to_string(*id)}}));
        return true;
    }
    if (command == "LOGIN") {
        const std::string username(protocol::header_value(request, "username"));
        const std::string password(protocol::header_value(request, "password"));
        if (username.empty() || password.empty()) {
            reply(status_message(command, "invalid"));
            return true;
        }
        auto user = auth_.authenticate(username, password);
        if (!user) {
            logger_.security("Failed login for " + username + " from " + client.peer);
            reply(status_message(command, "denied"));
            return true;
        }
        client.user_id = std::to_string(user->id);
        client.is_admin = user->is_admin;
        logger_.info("User " + username + " logged in from " + client.peer);
        reply(protocol::make_message({{"cmd", command},
                                      {"status", "ok"},
                                      {"token", jwt_.issue(user->id, user->is_admin)},
                                      {"user_id", client.user_id},
                                      {"admin", user->is_admin ? "1" : "0"}}));
        return true;
    }
    if (command == "TOKEN_AUTH") {
        const auto token = protocol::header_value(request, "token");
        if (token.empty()) {
            reply(status_message(command, "missing"));
            return true;
        }
        auto claims = jwt_.verify(std::string(token));
        if (!claims) {
            reply(status_message(command, "invalid"));
            return true;
        }
        client.user_id = claims->subject;
        client.is_admin = claims->is_admin;
        reply(protocol::make_message({{"cmd", command}, {"status", "ok"}, {"user_id", client.user_id}}));
        return true;
    }
    return false;
}

bool CommandRouter::handle_tree(const ClientSession& client,
                                const std::string& command,
                                const protocol::Message& request,
                                const Reply& reply) {
    const std::string& user = client.user_id;
    const auto path = protocol::header_value(request, "path");
    auto respond = [&](const Status& status) {
        reply(status ? status_message(command, "ok") : failure(command, client, status.error()));
    };

    if (command == "TREE_LIST") {
        auto entries = tree_.list(user, path);
        if (!entries) {
            reply(failure(command, client, entries.error()));
            return true;
        }
        std::ostringstream body;
        for (const auto& entry : entries.value()) {
            body << entry.name << "|" << kind_name(entry.kind) << "|" << entry.size << "|" << entry.modified << "\n";
        }
        auto resp = protocol::make_message(
            {{"cmd", command}, {"status", "ok"}, {"count", std::to_string(entries->size())}}, to_bytes(body.str()));
        reply(std::move(resp));
        return true;
    }
    if (command == "TREE_WALK") {
        auto root = tree_.walk(user, path);
        if (!root) {
            reply(failure(command, client, root.error()));
            return true;
        }
        std::ostringstream body;
        std::size_t count = 0;
        append_tree(root.value(), body, count);
        reply(protocol::make_message({{"cmd", command}, {"status", "ok"}, {"count", std::to_string(count)}},
                                     to_bytes(body.str())));
        return true;
    }
    if (command == "TREE_STAT") {
        auto info = tree_.stat(user, path);
        if (!info) {
            reply(failure(command, client, info.error()));
            return true;
        }
        reply(protocol::make_message({{"cmd", command},
                                      {"status", "ok"},
                                      {"path", info->path},
                                      {"kind", std::string(kind_name(info->kind))},
                                      {"size", std::to_string(info->size)},
                                      {"modified", std::to_string(info->modified)}}));
        return true;
    }
    if (command == "TREE_MKDIR") {
        respond(tree_.create_folder(user, path));
        return true;
    }
    if (command == "TREE_DELETE") {
        respond(tree_.remove(user, path));
        return true;
    }
    if (command == "TREE_RENAME") {
        const auto to = protocol::header_value(request, "to");
        if (!to.empty()) {
            respond(tree_.rename(user, path, to));
        } else {
            respond(tree_.rename_entry(user, path, protocol::header_value(request, "name")));
        }
        return true;
    }
    if (command == "TREE_MOVE") {
        respond(tree_.move(user, path, protocol::header_value(request, "folder")));
        return true;
    }
    if (command == "FILE_FETCH") {
        std::optional<std::uint64_t> offset;
        std::optional<std::uint64_t> length;
        if (!optional_count(request, "offset", offset) || !optional_count(request, "length", length)) {
            reply(status_message(command, "invalid"));
            return true;
        }
        const auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(length.value_or(max_fetch_bytes_), max_fetch_bytes_));
        auto chunk = tree_.read(user, path, offset.value_or(0), wanted);
        if (!chunk) {
            reply(failure(command, client, chunk.error()));
            return true;
        }
        const auto size = chunk->size();
        reply(protocol::make_message(
            {{"cmd", command}, {"status", size == 0 ? "done" : "ok"}, {"chunk", std::to_string(size)}},
            std::move(chunk.value())));
        return true;
    }
    return false;
}

bool CommandRouter::handle_upload(const ClientSession& client,
                                  const std::string& command,
                                  const protocol::Message& request,
                                  const Reply& reply) {
    const std::string& user = client.user_id;
    const std::string upload_id(protocol::header_value(request, "upload_id"));

    if (command == "UPLOAD_SMALL") {
        auto node = single_upload_.upload_small(user, protocol::header_value(request, "path"), request.body);
        if (!node) {
            reply(failure(command, client, node.error()));
            return true;
        }
        reply(protocol::make_message(
            {{"cmd", command}, {"status", "ok"}, {"path", node->path}, {"size", std::to_string(node->size)}}));
        return true;
    }
    if (command == "UPLOAD_BATCH") {
        handle_batch(client, request, reply);
        return true;
    }
    if (command == "UPLOAD_BEGIN") {
        std::optional<std::uint64_t> total;
        if (!optional_count(request, "total", total)) {
            reply(status_message(command, "invalid"));
            return true;
        }
        auto session = uploads_.begin_upload(user, protocol::header_value(request, "path"), total);
        if (!session) {
            reply(failure(command, client, session.error()));
            return true;
        }
        reply(protocol::make_message({{"cmd", command}, {"status", "ok"}, {"upload_id", session.value()}}));
        return true;
    }
    if (command == "UPLOAD_CHUNK") {
        const auto index = protocol::header_number<std::int64_t>(request, "index");
        if (!index) {
            reply(status_message(command, "invalid"));
            return true;
        }
        auto status = uploads_.write_chunk(user, upload_id, *index, request.body);
        if (!status) {
            reply(failure(command, client, status.error()));
            return true;
        }
        reply(protocol::make_message({{"cmd", command}, {"status", "ok"}, {"index", std::to_string(*index)}}));
        return true;
    }
    if (command == "UPLOAD_STATUS") {
        auto status = uploads_.upload_status(user, upload_id);
        if (!status) {
            reply(failure(command, client, status.error()));
            return true;
        }
        auto resp = protocol::make_message({{"cmd", command},
                                            {"status", "ok"},
                                            {"state", std::string(state_name(status->state))},
                                            {"path", status->destination},
                                            {"highest", std::to_string(status->highest_index)},
                                            {"received", join_indices(status->received)},
                                            {"staged_bytes", std::to_string(status->staged_bytes)}});
        if (status->declared_total) {
            resp.headers.emplace("total", std::to_string(*status->declared_total));
        }
        reply(std::move(resp));
        return true;
    }
    if (command == "UPLOAD_FINISH") {
        std::optional<std::uint64_t> total;
        if (!optional_count(request, "total", total)) {
            reply(status_message(command, "invalid"));
            return true;
        }
        executor_.submit("finish " + upload_id, [this, client, command, upload_id, total, reply]() {
            auto node = uploads_.finish_upload(client.user_id, upload_id, total);
            if (!node) {
                reply(failure(command, client, node.error()));
                return;
            }
            reply(protocol::make_message({{"cmd", command},
                                          {"status", "ok"},
                                          {"upload_id", upload_id},
                                          {"path", node->path},
                                          {"size", std::to_string(node->size)}}));
        });
        return true;
    }
    if (command == "UPLOAD_ABORT") {
        auto status = uploads_.abort_upload(user, upload_id);
        reply(status ? status_message(command, "ok") : failure(command, client, status.error()));
        return true;
    }
    return false;
}

// Headers: base, count, path.<i>, size.<i>. The body is every entry's bytes in order.
void CommandRouter::handle_batch(const ClientSession& client, const protocol::Message& request, const Reply& reply) {
    const std::string command = "UPLOAD_BATCH";
    const auto count = protocol::header_number<std::size_t>(request, "count");
    if (!count) {
        reply(status_message(command, "invalid"));
        return;
    }

    struct Layout {
        std::string path;
        std::size_t offset;
        std::size_t size;
    };
    std::vector<Layout> layout;
    layout.reserve(*count);
    std::size_t offset = 0;
    for (std::size_t i = 0; i < *count; ++i) {
        const auto index = std::to_string(i);
        const auto size = protocol::header_number<std::size_t>(request, "size." + index);
        if (!size || *size > request.body.size() - offset) {
            reply(status_message(command, "invalid"));
            return;
        }
        layout.push_back(Layout{std::string(protocol::header_value(request, "path." + index)), offset, *size});
        offset += *size;
    }
    if (offset != request.body.size()) {
        reply(status_message(command, "invalid"));
        return;
    }

    auto body = std::make_shared<std::vector<std::byte>>(request.body);
    const std::string base(protocol::header_value(request, "base"));
    executor_.submit("batch for user " + client.user_id,
                     [this, client, command, base, layout = std::move(layout), body, reply]() {
                         std::vector<BatchEntry> entries;
                         entries.reserve(layout.size());
                         const std::span<const std::byte> bytes(*body);
                         for (const auto& item : layout) {
                             entries.push_back(BatchEntry{item.path, bytes.subspan(item.offset, item.size)});
                         }
                         auto report = single_upload_.upload_batch(client.user_id, base, entries);
                         if (!report) {
                             reply(failure(command, client, report.error()));
                             return;
                         }
                         reply(protocol::make_message({{"cmd", command},
                                                       {"status", "ok"},
                                                       {"saved", std::to_string(report->saved)},
                                                       {"skipped", std::to_string(report->skipped)}}));
                     });
}

void CommandRouter::handle_stats(const ClientSession& client, const Reply& reply) {
    const std::string command = "STORAGE_STATS";
    auto usage = tree_.usage(client.user_id);
    if (!usage) {
        reply(failure(command, client, usage.error()));
        return;
    }
    auto disk = tree_.disk_stats();
    if (!disk) {
        reply(failure(command, client, disk.error()));
        return;
    }
    auto resp = protocol::make_message({{"cmd", command},
                                        {"status", "ok"},
                                        {"used_bytes", std::to_string(usage->used_bytes)},
                                        {"file_count", std::to_string(usage->file_count)},
                                        {"disk_capacity", std::to_string(disk->capacity)},
                                        {"disk_used", std::to_string(disk->used)},
                                        {"disk_free", std::to_string(disk->free)}});
    if (client.is_admin) {
        std::ostringstream body;
        std::size_t count = 0;
        for (const auto& user : auth_.list_users()) {
            auto user_usage = tree_.usage(std::to_string(user.id));
            if (!user_usage) {
                continue;
            }
            body << user.id << "|" << user.username << "|" << user_usage->used_bytes << "|" << user_usage->file_count
                 << "\n";
            ++count;
        }
        resp.headers.emplace("users", std::to_string(count));
        resp.body = to_bytes(body.str());
    }
    reply(std::move(resp));
}

}  // namespace vault::server
