#include "SortSession.hpp"

#include "AppException.hpp"
#include "BatchClassifier.hpp"
#include "FileScanner.hpp"
#include "PlacementService.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>


SortSession::SortSession(std::string target_dir,
                         std::size_t batch_size,
                         const BatchClassifier& classifier,
                         const PlacementService& placement,
                         std::shared_ptr<spdlog::logger> core_logger)
    : target_dir(std::move(target_dir)),
      batch_size(batch_size),
      classifier(classifier),
      placement(placement),
      core_logger(std::move(core_logger))
{
}


std::vector<Batch> SortSession::make_batches(const std::vector<FileEntry>& files, std::size_t batch_size)
{
    if (batch_size == 0) {
        throw std::invalid_argument("batch size must be greater than zero");
    }

    std::vector<Batch> batches;
    batches.reserve((files.size() + batch_size - 1) / batch_size);
    for (std::size_t start = 0; start < files.size(); start += batch_size) {
        const std::size_t end = std::min(files.size(), start + batch_size);
        batches.emplace_back(files.begin() + static_cast<std::ptrdiff_t>(start),
                             files.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return batches;
}


void SortSession::ensure_target_dir() const
{
    const std::filesystem::path path = Utils::utf8_to_path(target_dir);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_NOT_FOUND, target_dir);
    }
    if (!std::filesystem::is_directory(path, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_INVALID, target_dir);
    }
}


RunSummary SortSession::run(const ProgressCallback& progress_callback) const
{
    ensure_target_dir();

    const auto emit = [&](const std::string& message) {
        if (progress_callback) {
            progress_callback(message);
        }
    };

    RunSummary summary;

    FileScanner scanner;
    const std::vector<FileEntry> files = scanner.get_directory_entries(target_dir, FileScanOptions::Files);
    summary.files_found = files.size();

    if (files.empty()) {
        emit("No files found to sort.");
        return summary;
    }

    const std::vector<Batch> batches = make_batches(files, batch_size);
    summary.batches = batches.size();

    for (std::size_t index = 0; index < batches.size(); ++index) {
        const Batch& batch = batches[index];
        emit(fmt::format("Classifying batch {}/{} ({} file(s))...", index + 1, batches.size(), batch.size()));

        const auto mapping = classifier.classify(batch, progress_callback);
        if (!mapping) {
            ++summary.batches_skipped;
            if (core_logger) {
                core_logger->warn("Batch {}/{} skipped; {} file(s) left untouched",
                                  index + 1, batches.size(), batch.size());
            }
            continue;
        }

        const PlacementReport report = placement.place(*mapping, batch, target_dir, progress_callback);
        summary.files_moved += report.moved;
        summary.files_unmapped += report.unmapped;
        summary.files_failed += report.failed();
    }

    if (core_logger) {
        core_logger->info("Run finished for '{}': {} file(s), {} batch(es), {} skipped, {} moved, {} unmapped, {} failed",
                          target_dir, summary.files_found, summary.batches, summary.batches_skipped,
                          summary.files_moved, summary.files_unmapped, summary.files_failed);
    }

    return summary;
}
