#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr const char* kLogDirEnv = "LLMSORT_LOG_DIR";
constexpr const char* kLogLevelEnv = "LLMSORT_LOG_LEVEL";
constexpr const char* kLogFileName = "llmsort.log";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
}


std::string Logger::get_log_directory()
{
    if (const char* override_dir = std::getenv(kLogDirEnv)) {
        if (*override_dir != '\0') {
            return override_dir;
        }
    }
    return Utils::path_to_utf8(Utils::get_app_config_dir() / "logs");
}


spdlog::level::level_enum Logger::resolve_level()
{
    const char* value = std::getenv(kLogLevelEnv);
    if (!value || *value == '\0') {
        return spdlog::level::info;
    }

    std::string name(value);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"; only honour an explicit "off".
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}


void Logger::setup_loggers()
{
    if (spdlog::get("core_logger") && spdlog::get("ui_logger")) {
        return;
    }
    spdlog::drop("core_logger");
    spdlog::drop("ui_logger");

    const std::string log_dir = get_log_directory();
    std::filesystem::create_directories(Utils::utf8_to_path(log_dir));
    const std::string log_file =
        Utils::path_to_utf8(Utils::utf8_to_path(log_dir) / kLogFileName);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, kMaxLogFileSize, kMaxLogFiles);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_level(spdlog::level::warn);
    stderr_sink->set_pattern("%^[%l]%$ %v");

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    stdout_sink->set_pattern("%v");

    const auto level = resolve_level();

    std::vector<spdlog::sink_ptr> core_sinks{file_sink, stderr_sink};
    auto core_logger = std::make_shared<spdlog::logger>("core_logger", core_sinks.begin(), core_sinks.end());
    core_logger->set_level(level);
    core_logger->flush_on(spdlog::level::warn);

    std::vector<spdlog::sink_ptr> ui_sinks{stdout_sink, file_sink};
    auto ui_logger = std::make_shared<spdlog::logger>("ui_logger", ui_sinks.begin(), ui_sinks.end());
    ui_logger->set_level(spdlog::level::info);

    spdlog::register_logger(core_logger);
    spdlog::register_logger(ui_logger);
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
