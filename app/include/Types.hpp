#ifndef TYPES_HPP
#define TYPES_HPP

#include <string>
#include <unordered_map>
#include <vector>

struct FileEntry {
    std::string full_path;
    std::string file_name;
};

using Batch = std::vector<FileEntry>;

/// File name -> raw category label, as returned by the model.
using CategoryMapping = std::unordered_map<std::string, std::string>;

enum class FileScanOptions {
    None        = 0,
    Files       = 1 << 0,   // 0001
    HiddenFiles = 1 << 1    // 0010
};

inline bool has_flag(FileScanOptions value, FileScanOptions flag) {
    return (static_cast<int>(value) & static_cast<int>(flag)) != 0;
}

inline FileScanOptions operator|(FileScanOptions a, FileScanOptions b) {
    return static_cast<FileScanOptions>(static_cast<int>(a) | static_cast<int>(b));
}

#endif
