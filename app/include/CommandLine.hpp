#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <optional>
#include <string>

class Settings;

struct CommandLineOptions {
    std::optional<std::string> target_dir;
    std::optional<std::string> model;
    std::optional<std::string> api_url;
    std::optional<int> batch_size;
    std::optional<int> max_attempts;
    std::optional<int> retry_delay_seconds;
    std::optional<int> timeout_seconds;
    bool no_format_hint{false};
    bool dry_run{false};
    bool save_config{false};
    bool show_help{false};
    bool show_version{false};
};

/**
 * @brief Parses argv (argv[0] is skipped).
 *
 * Accepts "--flag value", "--flag=value" and "-f value".
 * @throws ErrorCodes::AppException (VALIDATION_INVALID_INPUT) for unknown
 *         flags, missing values and non-numeric numbers.
 */
CommandLineOptions parse_command_line(int argc, const char* const* argv);

/// Overrides only the settings that were given on the command line.
void apply_command_line(const CommandLineOptions& options, Settings& settings);

std::string usage_text(const std::string& program_name);

#endif
