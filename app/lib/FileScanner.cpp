#include "FileScanner.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

struct FileScanner::ScanContext {
    bool include_files{false};
    bool include_hidden{false};
    std::shared_ptr<spdlog::logger> logger;
};

std::vector<FileEntry>
FileScanner::get_directory_entries(const std::string &directory_path,
                                   FileScanOptions options)
{
    ScanContext context{has_flag(options, FileScanOptions::Files),
                        has_flag(options, FileScanOptions::HiddenFiles),
                        Logger::get_logger("core_logger")};

    std::vector<FileEntry> entries;
    if (!context.include_files) {
        return entries;
    }

    try {
        for (const auto& entry : fs::directory_iterator(Utils::utf8_to_path(directory_path))) {
            auto file = build_entry(entry, context);
            if (file) {
                entries.push_back(std::move(*file));
            }
        }
    } catch (const fs::filesystem_error& ex) {
        if (context.logger) {
            context.logger->warn("Cannot list '{}': {}", directory_path, ex.what());
        }
        throw;
    }

    if (context.logger) {
        context.logger->debug("Found {} file(s) in '{}'", entries.size(), directory_path);
    }
    return entries;
}


bool FileScanner::is_file_hidden(const fs::path &path) const {
    const std::string name = Utils::path_to_utf8(path.filename());
    return !name.empty() && name.front() == '.';
}


std::optional<FileEntry> FileScanner::build_entry(const fs::directory_entry& entry,
                                                  const ScanContext& context) const
{
    if (!context.include_hidden && is_file_hidden(entry.path())) {
        if (context.logger) {
            context.logger->trace("Skipping dot-entry '{}'", Utils::path_to_utf8(entry.path()));
        }
        return std::nullopt;
    }

    // Follows symlinks, so a dangling link still counts as a file.
    std::error_code ec;
    if (entry.is_directory(ec)) {
        return std::nullopt;
    }

    std::string file_name = Utils::path_to_utf8(entry.path().filename());
    if (!Utils::is_valid_utf8(file_name)) {
        if (context.logger) {
            context.logger->debug("Skipping '{}': name is not valid UTF-8", Utils::path_to_utf8(entry.path()));
        }
        return std::nullopt;
    }

    return FileEntry{Utils::path_to_utf8(entry.path()), std::move(file_name)};
}
