#pragma once

#include "logger.hpp"
#include "storage_error.hpp"
#include "storage_tree.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vault::server {

struct BatchEntry {
    // Path relative to the batch base folder, e.g. a browser's webkitRelativePath.
    std::string relative_path;
    std::span<const std::byte> data;
};

struct BatchReport {
    std::size_t saved = 0;
    std::size_t skipped = 0;
};

// Whole-body uploads: one small file, or a batch of files from a directory tree.
class SingleFileUpload {
public:
    SingleFileUpload(StorageTree& tree, std::uint64_t max_bytes, Logger& logger);

    Result<NodeInfo> upload_small(const std::string& user_id,
                                  std::string_view destination,
                                  std::span<const std::byte> data);

    // Every entry path is validated before anything is written; one bad path rejects the batch.
    Result<BatchReport> upload_batch(const std::string& user_id,
                                     std::string_view base_folder,
                                     const std::vector<BatchEntry>& entries);

private:
    StorageTree& tree_;
    std::uint64_t max_bytes_;
    Logger& logger_;
};

}  // namespace vault::server
