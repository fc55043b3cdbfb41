#ifndef PLACEMENT_SERVICE_HPP
#define PLACEMENT_SERVICE_HPP

#include "Types.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

struct PlacementReport {
    std::size_t moved{0};
    std::size_t unmapped{0};
    std::vector<std::string> failed_files;

    std::size_t failed() const { return failed_files.size(); }
};

class PlacementService {
public:
    using ProgressCallback = std::function<void(const std::string&)>;

    explicit PlacementService(std::shared_ptr<spdlog::logger> core_logger, bool dry_run = false);

    /**
     * @brief Moves every file of the batch that the mapping names into
     *        target_root/<sanitized category>.
     *
     * Files missing from the mapping stay where they are. A failure on one
     * file is recorded in the report and the remaining files still move.
     * Directories created for files that then fail to move are kept.
     */
    PlacementReport place(const CategoryMapping& mapping,
                          const Batch& batch,
                          const std::string& target_root,
                          const ProgressCallback& progress_callback = {}) const;

    bool is_dry_run() const { return dry_run_; }

private:
    bool place_one(const FileEntry& entry,
                   const std::string& category,
                   const std::string& target_root,
                   const ProgressCallback& progress_callback) const;

    std::shared_ptr<spdlog::logger> core_logger_;
    bool dry_run_{false};
};

#endif
