#include "single_file_upload.hpp"

namespace vault::server {

SingleFileUpload::SingleFileUpload(StorageTree& tree, std::uint64_t max_bytes, Logger& logger)
    : tree_(tree), max_bytes_(max_bytes), logger_(logger) {}

Result<NodeInfo> SingleFileUpload::upload_small(const std::string& user_id,
                                                std::string_view destination,
                                                std::span<const std::byte> data) {
    auto target = tree_.resolve(user_id, destination);
    if (!target) {
        return target.error();
    }
    if (data.size() > max_bytes_) {
        return make_error(StorageErrc::kInvalid, "payload exceeds single upload limit");
    }
    BufferSource source(data);
    auto node = tree_.put(target.value(), source);
    if (node) {
        logger_.info("User " + user_id + " uploaded " + node->path + " (" + std::to_string(node->size) + " bytes)");
    }
    return node;
}

Result<BatchReport> SingleFileUpload::upload_batch(const std::string& user_id,
                                                   std::string_view base_folder,
                                                   const std::vector<BatchEntry>& entries) {
    auto base = tree_.resolve(user_id, base_folder, true);
    if (!base) {
        return base.error();
    }

    std::vector<ResolvedPath> targets;
    targets.reserve(entries.size());
    for (const auto& entry : entries) {
        auto target = tree_.resolve_under(user_id, base.value(), entry.relative_path);
        if (!target) {
            return target.error();
        }
        if (entry.data.size() > max_bytes_) {
            return make_error(StorageErrc::kInvalid, "batch entry exceeds single upload limit");
        }
        targets.push_back(std::move(target.value()));
    }

    BatchReport report;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        BufferSource source(entries[i].data);
        auto node = tree_.put(targets[i], source);
        if (node) {
            ++report.saved;
            continue;
        }
        if (node.code() == StorageErrc::kIoFailure) {
            logger_.error("Batch upload for user " + user_id + " stopped: " + node.error().detail);
            return node.error();
        }
        ++report.skipped;
    }
    logger_.info("User " + user_id + " batch upload into '" + base->relative() + "': " +
                 std::to_string(report.saved) + " saved, " + std::to_string(report.skipped) + " skipped");
    return report;
}

}  // namespace vault::server
