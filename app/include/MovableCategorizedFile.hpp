#ifndef MOVABLECATEGORIZEDFILE_HPP
#define MOVABLECATEGORIZEDFILE_HPP

#include "Types.hpp"
#include <filesystem>
#include <string>

class MovableCategorizedFile {
public:
    /// @param category Must already be sanitized (a single path component).
    MovableCategorizedFile(const FileEntry& entry,
                           const std::string& target_root,
                           const std::string& category);
    ~MovableCategorizedFile();

    /// Creates target_root/category if missing; throws filesystem_error on failure.
    void create_cat_dir();

    /// Renames the file into the category directory. Never overwrites.
    bool move_file();

private:
    std::string file_name;
    std::filesystem::path source_path;
    std::filesystem::path category_path;
    std::filesystem::path destination_path;
};

#endif
