#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

class Logger {
public:
    /**
     * @brief Creates and registers "core_logger" and "ui_logger".
     *
     * core_logger writes to the rotating log file and echoes warnings to
     * stderr; ui_logger prints plain progress lines to stdout.
     * Calling it again is a no-op.
     */
    static void setup_loggers();

    /// Returns the registered logger or nullptr when setup has not run.
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_log_directory();

private:
    static spdlog::level::level_enum resolve_level();
};

#endif
