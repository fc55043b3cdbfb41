#ifndef UTILS_HPP
#define UTILS_HPP

#include <filesystem>
#include <string>

namespace Utils {

inline constexpr const char* kFallbackCategory = "Other";

std::filesystem::path utf8_to_path(const std::string& value);
std::string path_to_utf8(const std::filesystem::path& path);

bool is_valid_utf8(const std::string& value);

/**
 * @brief Reduces a free-text label to a directory-name token.
 *
 * Keeps Unicode letters and numbers, plus combining marks that follow a
 * kept letter (casing untouched). Returns kFallbackCategory when nothing
 * survives.
 */
std::string sanitize_category(const std::string& raw);

std::string trim_copy(const std::string& input);

/// $LLMSORT_CONFIG_DIR/LlmSort when set, else ~/.config/LlmSort.
std::filesystem::path get_app_config_dir();

} // namespace Utils

#endif
