#include "CommandLine.hpp"
#include "AppException.hpp"
#include "Settings.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string_view>

namespace {

struct FlagValue {
    std::string_view flag;
    std::optional<std::string> inline_value;
};

FlagValue split_flag(std::string_view arg)
{
    if (arg.starts_with("--")) {
        const auto eq = arg.find('=');
        if (eq != std::string_view::npos) {
            return {arg.substr(0, eq), std::string(arg.substr(eq + 1))};
        }
    }
    return {arg, std::nullopt};
}

class ArgCursor {
public:
    ArgCursor(int argc, const char* const* argv) : argc_(argc), argv_(argv) {}

    bool has_next() const { return index_ < argc_; }
    std::string_view next() { return argv_[index_++]; }

    std::string take_value(const FlagValue& current)
    {
        if (current.inline_value) {
            return *current.inline_value;
        }
        if (!has_next()) {
            THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                            fmt::format("missing value for {}", current.flag));
        }
        return std::string(next());
    }

private:
    int argc_;
    const char* const* argv_;
    int index_{1};
};

int parse_int_value(std::string_view flag, const std::string& value)
{
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                    fmt::format("{} expects an integer, got '{}'", flag, value));
}

bool is_one_of(std::string_view flag, std::string_view short_name, std::string_view long_name)
{
    return (!short_name.empty() && flag == short_name) || flag == long_name;
}

} // namespace


CommandLineOptions parse_command_line(int argc, const char* const* argv)
{
    CommandLineOptions options;
    ArgCursor cursor(argc, argv);

    while (cursor.has_next()) {
        const FlagValue current = split_flag(cursor.next());
        const std::string_view flag = current.flag;

        if (is_one_of(flag, "-h", "--help")) {
            options.show_help = true;
        } else if (is_one_of(flag, "-V", "--version")) {
            options.show_version = true;
        } else if (is_one_of(flag, "-t", "--target-dir")) {
            options.target_dir = cursor.take_value(current);
        } else if (is_one_of(flag, "-m", "--model")) {
            options.model = cursor.take_value(current);
        } else if (is_one_of(flag, "", "--api-url")) {
            options.api_url = cursor.take_value(current);
        } else if (is_one_of(flag, "-b", "--batch-size")) {
            options.batch_size = parse_int_value(flag, cursor.take_value(current));
        } else if (is_one_of(flag, "", "--max-attempts")) {
            options.max_attempts = parse_int_value(flag, cursor.take_value(current));
        } else if (is_one_of(flag, "", "--retry-delay")) {
            options.retry_delay_seconds = parse_int_value(flag, cursor.take_value(current));
        } else if (is_one_of(flag, "", "--timeout")) {
            options.timeout_seconds = parse_int_value(flag, cursor.take_value(current));
        } else if (flag == "--no-format-hint") {
            options.no_format_hint = true;
        } else if (flag == "--dry-run") {
            options.dry_run = true;
        } else if (flag == "--save-config") {
            options.save_config = true;
        } else {
            THROW_APP_ERROR(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                            fmt::format("unknown argument '{}'", flag));
        }
    }

    return options;
}


void apply_command_line(const CommandLineOptions& options, Settings& settings)
{
    if (options.target_dir) {
        settings.set_target_dir(*options.target_dir);
    }
    if (options.model) {
        settings.set_model(*options.model);
    }
    if (options.api_url) {
        settings.set_api_url(*options.api_url);
    }
    if (options.batch_size) {
        settings.set_batch_size(*options.batch_size);
    }
    if (options.max_attempts) {
        settings.set_max_attempts(*options.max_attempts);
    }
    if (options.retry_delay_seconds) {
        settings.set_retry_delay_seconds(*options.retry_delay_seconds);
    }
    if (options.timeout_seconds) {
        settings.set_request_timeout_seconds(*options.timeout_seconds);
    }
    if (options.no_format_hint) {
        settings.set_json_format_hint(false);
    }
}


std::string usage_text(const std::string& program_name)
{
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "Sorts the files of a directory into category folders suggested by an LLM.\n"
        "\n"
        "Options:\n"
        "  -t, --target-dir <dir>   Directory to sort (default: {})\n"
        "  -m, --model <name>       Model identifier (default: {})\n"
        "      --api-url <url>      Generate endpoint (default: {})\n"
        "  -b, --batch-size <n>     Files per request (default: {})\n"
        "      --max-attempts <n>   Attempts per batch (default: {})\n"
        "      --retry-delay <s>    Seconds between attempts (default: {})\n"
        "      --timeout <s>        Request timeout in seconds (default: {})\n"
        "      --no-format-hint     Do not send format=\"json\" to the endpoint\n"
        "      --dry-run            Classify but only print the planned moves\n"
        "      --save-config        Write the effective settings to config.ini\n"
        "  -h, --help               Show this help\n"
        "  -V, --version            Show the version\n",
        program_name,
        Settings::kDefaultTargetDir,
        Settings::kDefaultModel,
        Settings::kDefaultApiUrl,
        Settings::kDefaultBatchSize,
        Settings::kDefaultMaxAttempts,
        Settings::kDefaultRetryDelaySeconds,
        Settings::kDefaultRequestTimeoutSeconds);
}
