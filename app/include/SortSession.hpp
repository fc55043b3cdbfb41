#ifndef SORTSESSION_HPP
#define SORTSESSION_HPP

#include "Types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class BatchClassifier;
class PlacementService;
namespace spdlog { class logger; }

struct RunSummary {
    std::size_t files_found{0};
    std::size_t batches{0};
    std::size_t batches_skipped{0};
    std::size_t files_moved{0};
    std::size_t files_unmapped{0};
    std::size_t files_failed{0};
};

class SortSession {
public:
    using ProgressCallback = std::function<void(const std::string&)>;

    SortSession(std::string target_dir,
                std::size_t batch_size,
                const BatchClassifier& classifier,
                const PlacementService& placement,
                std::shared_ptr<spdlog::logger> core_logger);

    /**
     * @brief Scans the target directory once and sorts it batch by batch.
     *
     * @throws ErrorCodes::AppException when the target directory is missing
     *         or is not a directory; nothing is touched in that case.
     */
    RunSummary run(const ProgressCallback& progress_callback = {}) const;

    /// Splits in order; the last batch may be shorter. batch_size must be > 0.
    static std::vector<Batch> make_batches(const std::vector<FileEntry>& files, std::size_t batch_size);

private:
    void ensure_target_dir() const;

    std::string target_dir;
    std::size_t batch_size;
    const BatchClassifier& classifier;
    const PlacementService& placement;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
