#include "auth_service.hpp"
#include "chunk_upload_manager.hpp"
#include "command_router.hpp"
#include "config_loader.hpp"
#include "jwt_service.hpp"
#include "protocol.hpp"
#include "single_file_upload.hpp"
#include "storage_tree.hpp"
#include "task_executor.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace {

namespace protocol = vault::protocol;

using vault::server::AuthService;
using vault::server::ChunkUploadManager;
using vault::server::ClientSession;
using vault::server::CommandRouter;
using vault::server::JwtConfig;
using vault::server::JwtService;
using vault::server::Logger;
using vault::server::PathResolver;
using vault::server::SingleFileUpload;
using vault::server::StorageTree;
using vault::server::TaskExecutor;
using vault::server::UploadLimits;
using vault::test::bytes;
using vault::test::read_file;
using vault::test::text;
using vault::test::write_file;

using Headers = std::initializer_list<std::pair<std::string, std::string>>;

struct ServerContext {
    vault::test::Workspace workspace{"server_test"};
    Logger logger{(workspace.root() / "test.log").string(), vault::test::show_logs()};
    vault::test::LogCapture logs;
    AuthService auth{(workspace.root() / "db" / "vault.db").string()};
    JwtService jwt{JwtConfig{.issuer = "vault-test", .secret = "test-secret", .ttl_seconds = 3600}};
    StorageTree tree{workspace.root() / "users", PathResolver(), logger};
    ChunkUploadManager uploads{tree,
                               workspace.root() / "staging",
                               UploadLimits{.max_chunk_bytes = 4096,
                                            .max_upload_bytes = 1024 * 1024,
                                            .max_chunks = 256,
                                            .idle_timeout = std::chrono::seconds(60)},
                               logger};
    SingleFileUpload single{tree, 64 * 1024, logger};
    TaskExecutor executor{logger};
    CommandRouter router{auth, jwt, tree, uploads, single, executor, logger, 4096};

    ClientSession client{"127.0.0.1:50000", "", false};
    std::mutex replies_mutex;
    std::vector<protocol::Message> replies;

    ServerContext() {
        logs.attach(logger);
        auth.initialize_schema();
        auth.ensure_admin("root", "rootpass");
        executor.start(2);
    }

    ~ServerContext() { executor.shutdown(); }

    std::size_t reply_count() {
        std::lock_guard<std::mutex> lock(replies_mutex);
        return replies.size();
    }

    // Dispatches one request and waits for its reply, which may come from an executor worker.
    protocol::Message call(const std::string& command,
                           const std::string& token,
                           Headers headers = {},
                           const std::string& body = {}) {
        auto request = protocol::make_message(headers, bytes(body));
        request.headers.emplace("cmd", command);
        if (!token.empty()) {
            request.headers.emplace("token", token);
        }
        const auto before = reply_count();
        router.dispatch(client, request, [this](protocol::Message response) {
            std::lock_guard<std::mutex> lock(replies_mutex);
            replies.push_back(std::move(response));
        });
        if (!vault::test::wait_for_condition([&] { return reply_count() > before; }, std::chrono::seconds(5))) {
            throw std::runtime_error("No reply to " + command);
        }
        std::lock_guard<std::mutex> lock(replies_mutex);
        return replies.back();
    }

    std::string login(const std::string& username, const std::string& password) {
        auto registered = call("REGISTER", "", {{"username", username}, {"password", password}});
        (void)registered;
        auto response = call("LOGIN", "", {{"username", username}, {"password", password}});
        return std::string(protocol::header_value(response, "token"));
    }

    std::filesystem::path root_of(const std::string& user_id) const { return tree.user_root(user_id); }
};

std::string status_of(const protocol::Message& msg) {
    return std::string(protocol::header_value(msg, "status"));
}

std::string header(const protocol::Message& msg, const std::string& key) {
    return std::string(protocol::header_value(msg, key));
}

using TestCase = vault::test::TestCase<ServerContext>;

bool test_auth_register_and_authenticate(ServerContext& ctx) {
    auto id = ctx.auth.register_user("alice", "wonderland");
    if (!id || *id <= 0 || ctx.auth.register_user("alice", "again").has_value() ||
        ctx.auth.register_user("", "pw").has_value()) {
        return false;
    }
    auto user = ctx.auth.authenticate("alice", "wonderland");
    if (!user || user->id != *id || user->is_admin || user->password_hash == "wonderland") {
        return false;
    }
    auto by_id = ctx.auth.find_by_id(*id);
    return !ctx.auth.authenticate("alice", "Wonderland") && !ctx.auth.authenticate("nobody", "wonderland") &&
           by_id && by_id->username == "alice";
}

bool test_auth_admin_bootstrap(ServerContext& ctx) {
    ctx.auth.ensure_admin("root", "different");
    auto admin = ctx.auth.authenticate("root", "rootpass");
    if (!admin || !admin->is_admin || ctx.auth.authenticate("root", "different")) {
        return false;
    }
    ctx.auth.register_user("zed", "pw");
    const auto users = ctx.auth.list_users();
    return users.size() == 2 && users.front().username == "root" && users.back().username == "zed";
}

bool test_jwt_round_trip(ServerContext& ctx) {
    const auto token = ctx.jwt.issue(42, true);
    auto claims = ctx.jwt.verify(token);
    if (!claims || claims->subject != "42" || !claims->is_admin || claims->expires_at != claims->issued_at + 3600) {
        return false;
    }
    auto plain = ctx.jwt.verify(ctx.jwt.issue(7, false));
    return plain && plain->subject == "7" && !plain->is_admin && ctx.jwt.issue(7, false) != ctx.jwt.issue(7, false);
}

bool test_jwt_rejects_forgeries(ServerContext& ctx) {
    auto token = ctx.jwt.issue(42, false);
    const auto first_dot = token.find('.');
    if (first_dot == std::string::npos) {
        return false;
    }
    auto tampered = token;
    auto& ch = tampered[first_dot + 6];
    ch = ch == 'A' ? 'B' : 'A';

    JwtService other_secret(JwtConfig{.issuer = "vault-test", .secret = "other-secret", .ttl_seconds = 3600});
    JwtService other_issuer(JwtConfig{.issuer = "someone-else", .secret = "test-secret", .ttl_seconds = 3600});
    return !ctx.jwt.verify(tampered) && !ctx.jwt.verify(other_secret.issue(42, false)) &&
           !ctx.jwt.verify(other_issuer.issue(42, false)) && !ctx.jwt.verify("") &&
           !ctx.jwt.verify("not.a.token") && !ctx.jwt.verify(token.substr(0, token.rfind('.')));
}

bool test_jwt_expiry(ServerContext& ctx) {
    (void)ctx;
    JwtService short_lived(JwtConfig{.issuer = "vault-test", .secret = "test-secret", .ttl_seconds = 0});
    const auto token = short_lived.issue(3, false);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    return !short_lived.verify(token);
}

bool test_config_loading(ServerContext& ctx) {
    const auto path = ctx.workspace.root() / "vault.conf";
    write_file(path,
               "# test config\n"
               "listen_port = 7100\n"
               "storage_root=/srv/vault\n"
               "max_chunk_bytes = 1048576\n"
               "session_idle_timeout_seconds = 90\n"
               "jwt_secret = s3cret=with=equals\n"
               "not_a_key = 1\n"
               "\n");
    auto config = vault::server::load_config(path.string());
    if (config.listen_port != 7100 || config.storage_root != "/srv/vault" || config.max_chunk_bytes != 1048576 ||
        config.session_idle_timeout_seconds != 90 || config.jwt_secret != "s3cret=with=equals" ||
        config.max_component_length != 255) {
        return false;
    }
    auto defaults = vault::server::load_config((ctx.workspace.root() / "missing.conf").string());
    if (defaults.listen_port != 6000 || defaults.max_path_length != 4096) {
        return false;
    }
    for (const auto* bad : {"listen_port = 70000\n",
                            "max_chunk_bytes = 12kb\n",
                            "sweep_interval_seconds = -5\n",
                            "sweep_interval_seconds = 0\n"}) {
        write_file(path, bad);
        try {
            vault::server::load_config(path.string());
            return false;
        } catch (const std::runtime_error&) {
        }
    }
    return true;
}

bool test_logger_listener_may_log(ServerContext& ctx) {
    Logger logger((ctx.workspace.root() / "reentrant.log").string(), false);
    std::atomic<int> calls{0};
    logger.add_listener([&](LogLevel level, std::string_view message) {
        ++calls;
        if (level == LogLevel::kSecurity) {
            logger.warn("Escalated: " + std::string(message));
        }
    });

    std::thread other([&] { logger.info("from another thread"); });
    logger.security("cross-user session access");
    other.join();
    return calls == 3 && read_file(ctx.workspace.root() / "reentrant.log").find("[WARN] Escalated: ") !=
                             std::string::npos;
}

bool test_protocol_framing(ServerContext& ctx) {
    (void)ctx;
    auto first = protocol::encode(protocol::make_message({{"cmd", "UPLOAD_CHUNK"}, {"index", "3"}}, bytes("abc")));
    auto second = protocol::encode(protocol::make_message({{"cmd", "TREE_LIST"}, {"path", "a=b"}}));

    std::vector<std::byte> buffer(first.begin(), first.end() - 1);
    std::size_t offset = 0;
    protocol::Message out;
    if (protocol::try_decode(buffer, offset, out, 1024)) {
        return false;
    }
    buffer.push_back(first.back());
    buffer.insert(buffer.end(), second.begin(), second.end());
    if (!protocol::try_decode(buffer, offset, out, 1024) || header(out, "cmd") != "UPLOAD_CHUNK" ||
        protocol::header_number<std::int64_t>(out, "index") != 3 || text(out.body) != "abc") {
        return false;
    }
    if (!protocol::try_decode(buffer, offset, out, 1024) || header(out, "path") != "a=b" || !out.body.empty()) {
        return false;
    }
    return !protocol::try_decode(buffer, offset, out, 1024);
}

bool test_protocol_rejects_bad_frames(ServerContext& ctx) {
    (void)ctx;
    auto oversized = protocol::encode(protocol::make_message({{"cmd", "UPLOAD_SMALL"}}, bytes(std::string(100, 'x'))));
    // Only the fixed header: the limit is enforced before the body arrives.
    std::vector<std::byte> head(oversized.begin(), oversized.begin() + 12);
    std::size_t offset = 0;
    protocol::Message out;
    bool rejected_size = false;
    try {
        protocol::try_decode(head, offset, out, 99);
    } catch (const protocol::ProtocolError&) {
        rejected_size = true;
    }

    auto garbage = bytes("GET / HTTP/1.1\r\n\r\n");
    offset = 0;
    bool rejected_magic = false;
    try {
        protocol::try_decode(garbage, offset, out, 1024);
    } catch (const protocol::ProtocolError&) {
        rejected_magic = true;
    }

    bool rejected_header = false;
    try {
        protocol::encode(protocol::make_message({{"path", "line\nbreak"}}));
    } catch (const std::invalid_argument&) {
        rejected_header = true;
    }

    auto numbers = protocol::make_message({{"a", "12x"}, {"b", "-1"}, {"c", ""}});
    return rejected_size && rejected_magic && rejected_header &&
           !protocol::header_number<std::uint64_t>(numbers, "a") &&
           !protocol::header_number<std::uint64_t>(numbers, "b") &&
           !protocol::header_number<std::uint64_t>(numbers, "c");
}

bool test_executor_runs_and_reports_tasks(ServerContext& ctx) {
    TaskExecutor pool(ctx.logger);
    pool.start(2);
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        pool.submit("count " + std::to_string(i), [&ran] { ++ran; });
    }
    pool.submit("explode", [] { throw std::runtime_error("disk on fire"); });
    pool.shutdown();
    bool rejected = false;
    try {
        pool.submit("late", [] {});
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    return ran == 10 && rejected && pool.pending() == 0 &&
           ctx.logs.contains("ERROR: Background task explode failed: disk on fire");
}

bool test_router_requires_token(ServerContext& ctx) {
    auto missing_cmd = ctx.call("", "");
    return header(missing_cmd, "status") == "missing_command" &&
           status_of(ctx.call("TREE_LIST", "")) == "auth_required" &&
           status_of(ctx.call("TREE_LIST", "forged.token.value")) == "token_invalid" &&
           status_of(ctx.call("TOKEN_AUTH", "")) == "missing";
}

bool test_router_register_and_login(ServerContext& ctx) {
    auto registered = ctx.call("REGISTER", "", {{"username", "alice"}, {"password", "pw1"}});
    if (status_of(registered) != "ok" || header(registered, "user_id").empty()) {
        return false;
    }
    if (status_of(ctx.call("REGISTER", "", {{"username", "alice"}, {"password", "pw2"}})) != "exists" ||
        status_of(ctx.call("REGISTER", "", {{"username", "bob"}})) != "invalid") {
        return false;
    }
    if (status_of(ctx.call("LOGIN", "", {{"username", "alice"}, {"password", "wrong"}})) != "denied" ||
        !ctx.logs.contains("SECURITY: Failed login for alice")) {
        return false;
    }
    auto login = ctx.call("LOGIN", "", {{"username", "alice"}, {"password", "pw1"}});
    if (status_of(login) != "ok" || header(login, "admin") != "0" ||
        header(login, "user_id") != header(registered, "user_id")) {
        return false;
    }
    auto resumed = ctx.call("TOKEN_AUTH", header(login, "token"));
    return status_of(resumed) == "ok" && header(resumed, "user_id") == header(registered, "user_id");
}

bool test_router_chunked_upload(ServerContext& ctx) {
    const auto token = ctx.login("alice", "pw");
    auto begin = ctx.call("UPLOAD_BEGIN", token, {{"path", "reports/q1.csv"}, {"total", "3"}});
    const auto id = header(begin, "upload_id");
    if (status_of(begin) != "ok" || id.empty()) {
        return false;
    }
    const std::vector<std::pair<std::string, std::string>> chunks = {{"2", "c3\n"}, {"0", "a1\n"}, {"1", "b2\n"}};
    for (const auto& [index, content] : chunks) {
        if (status_of(ctx.call("UPLOAD_CHUNK", token, {{"upload_id", id}, {"index", index}}, content)) != "ok") {
            return false;
        }
    }
    auto status = ctx.call("UPLOAD_STATUS", token, {{"upload_id", id}});
    if (header(status, "state") != "receiving" || header(status, "received") != "0,1,2" ||
        header(status, "highest") != "2" || header(status, "total") != "3" || header(status, "staged_bytes") != "9") {
        return false;
    }
    auto finish = ctx.call("UPLOAD_FINISH", token, {{"upload_id", id}});
    if (status_of(finish) != "ok" || header(finish, "path") != "reports/q1.csv" || header(finish, "size") != "9") {
        return false;
    }
    auto fetched = ctx.call("FILE_FETCH", token, {{"path", "reports/q1.csv"}, {"offset", "3"}, {"length", "3"}});
    auto tail = ctx.call("FILE_FETCH", token, {{"path", "reports/q1.csv"}, {"offset", "9"}});
    return status_of(fetched) == "ok" && text(fetched.body) == "b2\n" && header(fetched, "chunk") == "3" &&
           status_of(tail) == "done" && tail.body.empty() &&
           status_of(ctx.call("UPLOAD_CHUNK", token, {{"upload_id", id}, {"index", "0"}}, "x")) == "notfound";
}

bool test_router_incomplete_finish(ServerContext& ctx) {
    const auto token = ctx.login("alice", "pw");
    const auto id = header(ctx.call("UPLOAD_BEGIN", token, {{"path", "big.bin"}, {"total", "2"}}), "upload_id");
    if (status_of(ctx.call("UPLOAD_CHUNK", token, {{"upload_id", id}, {"index", "1"}}, "tail")) != "ok") {
        return false;
    }
    return status_of(ctx.call("UPLOAD_FINISH", token, {{"upload_id", id}})) == "incomplete" &&
           status_of(ctx.call("UPLOAD_FINISH", token, {{"upload_id", id}, {"total", "5"}})) == "incomplete" &&
           status_of(ctx.call("UPLOAD_CHUNK", token, {{"upload_id", id}, {"index", "abc"}}, "x")) == "invalid" &&
           status_of(ctx.call("UPLOAD_CHUNK", token, {{"upload_id", id}, {"index", "-1"}}, "x")) == "invalid" &&
           status_of(ctx.call("UPLOAD_ABORT", token, {{"upload_id", id}})) == "ok" &&
           !std::filesystem::exists(ctx.root_of(header(ctx.call("TOKEN_AUTH", token), "user_id")) / "big.bin");
}

bool test_router_rejects_traversal(ServerContext& ctx) {
    const auto token = ctx.login("mallory", "pw");
    return status_of(ctx.call("UPLOAD_BEGIN", token, {{"path", "../../etc/passwd"}, {"total", "1"}})) ==
               "traversal" &&
           status_of(ctx.call("TREE_LIST", token, {{"path", "docs/../../.."}})) == "traversal" &&
           status_of(ctx.call("UPLOAD_SMALL", token, {{"path", "a/%2e%2e/%2e%2e/x"}}, "x")) == "traversal" &&
           ctx.uploads.active_sessions() == 0 && ctx.logs.contains("SECURITY: Traversal attempt by user");
}

bool test_router_tree_commands(ServerContext& ctx) {
    const auto token = ctx.login("carol", "pw");
    if (status_of(ctx.call("TREE_MKDIR", token, {{"path", "docs"}})) != "ok" ||
        status_of(ctx.call("TREE_MKDIR", token, {{"path", "archive"}})) != "ok" ||
        status_of(ctx.call("UPLOAD_SMALL", token, {{"path", "docs/a.txt"}}, "hello")) != "ok") {
        return false;
    }
    auto listing = ctx.call("TREE_LIST", token, {{"path", "docs"}});
    if (header(listing, "count") != "1" || text(listing.body).rfind("a.txt|file|5|", 0) != 0) {
        return false;
    }
    if (status_of(ctx.call("TREE_RENAME", token, {{"path", "docs/a.txt"}, {"name", "b.txt"}})) != "ok" ||
        status_of(ctx.call("TREE_MOVE", token, {{"path", "docs/b.txt"}, {"folder", "archive"}})) != "ok" ||
        status_of(ctx.call("TREE_RENAME", token, {{"path", "docs"}, {"name", "../escape"}})) == "ok") {
        return false;
    }
    auto walk = ctx.call("TREE_WALK", token);
    if (text(walk.body).find("archive/b.txt|file|5\n") == std::string::npos || header(walk, "count") != "3") {
        return false;
    }
    auto stat = ctx.call("TREE_STAT", token, {{"path", "archive/b.txt"}});
    if (header(stat, "kind") != "file" || header(stat, "size") != "5") {
        return false;
    }
    return status_of(ctx.call("TREE_DELETE", token, {{"path", "archive"}})) == "ok" &&
           status_of(ctx.call("TREE_STAT", token, {{"path", "archive/b.txt"}})) == "notfound" &&
           status_of(ctx.call("TREE_DELETE", token)) != "ok";
}

bool test_router_batch_upload(ServerContext& ctx) {
    const auto token = ctx.login("dave", "pw");
    auto batch = ctx.call("UPLOAD_BATCH",
                          token,
                          {{"base", "photos"},
                           {"count", "2"},
                           {"path.0", "trip/day1.txt"},
                           {"size.0", "3"},
                           {"path.1", "index.txt"},
                           {"size.1", "2"}},
                          "abcde");
    if (status_of(batch) != "ok" || header(batch, "saved") != "2" || header(batch, "skipped") != "0") {
        return false;
    }
    const auto root = ctx.root_of(header(ctx.call("TOKEN_AUTH", token), "user_id"));
    if (read_file(root / "photos" / "trip" / "day1.txt") != "abc" || read_file(root / "photos" / "index.txt") != "de") {
        return false;
    }
    auto short_body = ctx.call("UPLOAD_BATCH",
                               token,
                               {{"base", "photos"}, {"count", "1"}, {"path.0", "x.txt"}, {"size.0", "10"}},
                               "abc");
    auto traversal = ctx.call("UPLOAD_BATCH",
                              token,
                              {{"base", "photos"},
                               {"count", "2"},
                               {"path.0", "ok.txt"},
                               {"size.0", "1"},
                               {"path.1", "../../../evil.txt"},
                               {"size.1", "1"}},
                              "ab");
    return status_of(short_body) == "invalid" && status_of(traversal) == "traversal" &&
           !std::filesystem::exists(root / "photos" / "ok.txt");
}

bool test_router_isolates_users(ServerContext& ctx) {
    const auto alice = ctx.login("alice", "pw");
    const auto bob = ctx.login("bob", "pw");
    const auto id = header(ctx.call("UPLOAD_BEGIN", alice, {{"path", "secret.txt"}}), "upload_id");
    if (id.empty() || status_of(ctx.call("UPLOAD_SMALL", alice, {{"path", "diary.txt"}}, "dear diary")) != "ok") {
        return false;
    }
    return status_of(ctx.call("UPLOAD_CHUNK", bob, {{"upload_id", id}, {"index", "0"}}, "x")) == "notfound" &&
           status_of(ctx.call("UPLOAD_ABORT", bob, {{"upload_id", id}})) == "notfound" &&
           ctx.logs.contains("referenced upload session owned by user") &&
           header(ctx.call("TREE_LIST", bob), "count") == "0" &&
           status_of(ctx.call("FILE_FETCH", bob, {{"path", "diary.txt"}})) == "notfound" &&
           status_of(ctx.call("UPLOAD_STATUS", alice, {{"upload_id", id}})) == "ok";
}

bool test_router_storage_stats(ServerContext& ctx) {
    const auto token = ctx.login("erin", "pw");
    if (status_of(ctx.call("UPLOAD_SMALL", token, {{"path", "notes.txt"}}, "12345678")) != "ok") {
        return false;
    }
    auto own = ctx.call("STORAGE_STATS", token);
    if (status_of(own) != "ok" || header(own, "used_bytes") != "8" || header(own, "file_count") != "1" ||
        own.headers.count("users") != 0 || header(own, "disk_capacity").empty()) {
        return false;
    }
    auto admin_login = ctx.call("LOGIN", "", {{"username", "root"}, {"password", "rootpass"}});
    if (header(admin_login, "admin") != "1") {
        return false;
    }
    auto all = ctx.call("STORAGE_STATS", header(admin_login, "token"));
    return header(all, "users") == "2" && text(all.body).find("|erin|8|1\n") != std::string::npos &&
           status_of(ctx.call("NO_SUCH_COMMAND", token)) == "unknown";
}

}  // namespace

int main() {
    const std::vector<TestCase> tests = {
        {"auth_register_and_authenticate", test_auth_register_and_authenticate},
        {"auth_admin_bootstrap", test_auth_admin_bootstrap},
        {"jwt_round_trip", test_jwt_round_trip},
        {"jwt_rejects_forgeries", test_jwt_rejects_forgeries},
        {"jwt_expiry", test_jwt_expiry},
        {"config_loading", test_config_loading},
        {"logger_listener_may_log", test_logger_listener_may_log},
        {"protocol_framing", test_protocol_framing},
        {"protocol_rejects_bad_frames", test_protocol_rejects_bad_frames},
        {"executor_runs_and_reports_tasks", test_executor_runs_and_reports_tasks},
        {"router_requires_token", test_router_requires_token},
        {"router_register_and_login", test_router_register_and_login},
        {"router_chunked_upload", test_router_chunked_upload},
        {"router_incomplete_finish", test_router_incomplete_finish},
        {"router_rejects_traversal", test_router_rejects_traversal},
        {"router_tree_commands", test_router_tree_commands},
        {"router_batch_upload", test_router_batch_upload},
        {"router_isolates_users", test_router_isolates_users},
        {"router_storage_stats", test_router_storage_stats},
    };
    return vault::test::run_tests("server", tests);
}
