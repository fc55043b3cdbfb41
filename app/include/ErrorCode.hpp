#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

// Only fatal conditions get a code. Per-attempt and per-file failures are
// reported through result values and never reach this catalogue.
enum class Code {
    // File system (1200-1299)
    DIRECTORY_NOT_FOUND = 1210,
    DIRECTORY_INVALID = 1211,

    // Configuration (1500-1599)
    CONFIG_SAVE_FAILED = 1503,
    CONFIG_INVALID_VALUE = 1505,

    // Validation (1600-1699)
    VALIDATION_INVALID_INPUT = 1600,

    UNKNOWN_ERROR = 9999
};

struct ErrorInfo {
    Code code;
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    std::string get_full_details() const {
        std::string details = "Error " + std::to_string(static_cast<int>(code)) + ": " + message;
        if (!context.empty()) {
            details += "\nDetails: " + context;
        }
        if (!resolution.empty()) {
            details += "\nResolution: " + resolution;
        }
        return details;
    }
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "") {
        switch (code) {
            case Code::DIRECTORY_NOT_FOUND:
                return {code,
                        "Target directory does not exist.",
                        "Check the --target-dir argument or the TargetDir setting.",
                        context};
            case Code::DIRECTORY_INVALID:
                return {code,
                        "Target path is not a directory.",
                        "Point --target-dir at a directory, not a file.",
                        context};
            case Code::CONFIG_SAVE_FAILED:
                return {code,
                        "Failed to save the configuration file.",
                        "Make sure the configuration directory is writable.",
                        context};
            case Code::CONFIG_INVALID_VALUE:
                return {code,
                        "Invalid configuration value.",
                        "Fix the value on the command line or in config.ini.",
                        context};
            case Code::VALIDATION_INVALID_INPUT:
                return {code,
                        "Invalid command-line argument.",
                        "Run with --help to list the supported options.",
                        context};
            case Code::UNKNOWN_ERROR:
            default:
                return {Code::UNKNOWN_ERROR, "An unknown error occurred.", "", context};
        }
    }
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
