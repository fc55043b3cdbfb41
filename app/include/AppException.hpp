#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <utility>
#include <string>

namespace ErrorCodes {

// Fatal error that aborts the run. what() is the catalogue message followed
// by the context in parentheses.
class AppException : public std::runtime_error {
public:
    explicit AppException(Code code, const std::string& context = "")
        : AppException(ErrorCatalog::get_error_info(code, context)) {}

    Code get_error_code() const noexcept { return info_.code; }
    const ErrorInfo& get_error_info() const noexcept { return info_; }
    std::string get_full_details() const { return info_.get_full_details(); }

private:
    explicit AppException(ErrorInfo info)
        : std::runtime_error(info.context.empty() ? info.message
                                                  : info.message + " (" + info.context + ")"),
          info_(std::move(info)) {}

    ErrorInfo info_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#endif // APPEXCEPTION_HPP
