#include "PlacementService.hpp"

#include "MovableCategorizedFile.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

PlacementService::PlacementService(std::shared_ptr<spdlog::logger> core_logger, bool dry_run)
    : core_logger_(std::move(core_logger)),
      dry_run_(dry_run) {}

PlacementReport PlacementService::place(const CategoryMapping& mapping,
                                        const Batch& batch,
                                        const std::string& target_root,
                                        const ProgressCallback& progress_callback) const
{
    PlacementReport report;

    for (const auto& entry : batch) {
        const auto it = mapping.find(entry.file_name);
        if (it == mapping.end()) {
            if (core_logger_) {
                core_logger_->info("No category returned for '{}'; leaving it in place", entry.file_name);
            }
            ++report.unmapped;
            continue;
        }

        const std::string category = Utils::sanitize_category(it->second);
        if (place_one(entry, category, target_root, progress_callback)) {
            ++report.moved;
        } else {
            report.failed_files.push_back(entry.file_name);
        }
    }

    const std::size_t matched = report.moved + report.failed();
    if (core_logger_ && mapping.size() > matched) {
        core_logger_->debug("Ignored {} mapping entries naming files outside the batch",
                            mapping.size() - matched);
    }

    return report;
}

bool PlacementService::place_one(const FileEntry& entry,
                                 const std::string& category,
                                 const std::string& target_root,
                                 const ProgressCallback& progress_callback) const
{
    if (progress_callback) {
        progress_callback(fmt::format("{} '{}' -> '{}'",
                                      dry_run_ ? "Would move" : "Moving",
                                      entry.file_name, category));
    }
    if (dry_run_) {
        return true;
    }

    try {
        MovableCategorizedFile movable(entry, target_root, category);
        movable.create_cat_dir();
        return movable.move_file();
    } catch (const std::filesystem::filesystem_error& ex) {
        if (core_logger_) {
            core_logger_->error("Could not place '{}' into '{}': {}", entry.file_name, category, ex.what());
        }
    } catch (const std::invalid_argument& ex) {
        if (core_logger_) {
            core_logger_->error("Could not place '{}': {}", entry.file_name, ex.what());
        }
    }
    return false;
}
