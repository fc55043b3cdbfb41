#include "MovableCategorizedFile.hpp"
#include "Utils.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <stdexcept>
#include <system_error>


MovableCategorizedFile::MovableCategorizedFile(const FileEntry& entry,
                                               const std::string& target_root,
                                               const std::string& category)
    : file_name(entry.file_name)
{
    if (target_root.empty() || category.empty() || entry.file_name.empty() || entry.full_path.empty()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Invalid path components while constructing MovableCategorizedFile (root='{}', category='{}', file='{}')",
                          target_root, category, entry.file_name);
        }
        throw std::invalid_argument("Invalid path component in MovableCategorizedFile constructor.");
    }

    source_path = Utils::utf8_to_path(entry.full_path);
    category_path = Utils::utf8_to_path(target_root) / Utils::utf8_to_path(category);
    destination_path = category_path / Utils::utf8_to_path(file_name);
}


void MovableCategorizedFile::create_cat_dir()
{
    try {
        if (!std::filesystem::exists(category_path)) {
            std::filesystem::create_directory(category_path);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to create directory for '{}': {}", file_name, e.what());
        }
        throw;
    }
}


bool MovableCategorizedFile::move_file()
{
    std::error_code ec;
    if (!std::filesystem::exists(source_path, ec)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Source file missing when moving '{}': {}", file_name, Utils::path_to_utf8(source_path));
        }
        return false;
    }

    if (std::filesystem::exists(destination_path, ec)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Destination already contains '{}'; skipping move", Utils::path_to_utf8(destination_path));
        }
        return false;
    }

    try {
        std::filesystem::rename(source_path, destination_path);
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("Moved '{}' to '{}'", Utils::path_to_utf8(source_path), Utils::path_to_utf8(destination_path));
        }
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to move '{}' to '{}': {}", Utils::path_to_utf8(source_path), Utils::path_to_utf8(destination_path), e.what());
        }
        return false;
    }
}


MovableCategorizedFile::~MovableCategorizedFile() {}
