#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <utility>


namespace {
constexpr const char* kSection = "Settings";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

int parse_int_or(const std::string& key, const std::string& value, int fallback) {
    if (value.empty()) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // handled below
    }
    settings_log(spdlog::level::warn, "Ignoring non-numeric value '{}' for {}", value, key);
    return fallback;
}

std::string bool_to_string(bool value) {
    return value ? "true" : "false";
}
}


Settings::Settings()
    : config_path(define_config_path())
{
}


std::string Settings::define_config_path() const
{
    return Utils::path_to_utf8(Utils::get_app_config_dir() / "config.ini");
}


std::string Settings::get_config_path() const
{
    return config_path;
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    target_dir = config.getValue(kSection, "TargetDir", kDefaultTargetDir);
    model = config.getValue(kSection, "Model", kDefaultModel);
    api_url = config.getValue(kSection, "ApiUrl", kDefaultApiUrl);
    batch_size = parse_int_or("BatchSize", config.getValue(kSection, "BatchSize"), kDefaultBatchSize);
    max_attempts = parse_int_or("MaxAttempts", config.getValue(kSection, "MaxAttempts"), kDefaultMaxAttempts);
    retry_delay_seconds = parse_int_or("RetryDelaySeconds",
                                       config.getValue(kSection, "RetryDelaySeconds"),
                                       kDefaultRetryDelaySeconds);
    request_timeout_seconds = parse_int_or("RequestTimeoutSeconds",
                                           config.getValue(kSection, "RequestTimeoutSeconds"),
                                           kDefaultRequestTimeoutSeconds);
    json_format_hint = config.getValue(kSection, "JsonFormatHint", "true") != "false";

    settings_log(spdlog::level::debug, "Loaded settings from {}", config_path);
    return true;
}


bool Settings::save()
{
    config.setValue(kSection, "TargetDir", target_dir);
    config.setValue(kSection, "Model", model);
    config.setValue(kSection, "ApiUrl", api_url);
    config.setValue(kSection, "BatchSize", std::to_string(batch_size));
    config.setValue(kSection, "MaxAttempts", std::to_string(max_attempts));
    config.setValue(kSection, "RetryDelaySeconds", std::to_string(retry_delay_seconds));
    config.setValue(kSection, "RequestTimeoutSeconds", std::to_string(request_timeout_seconds));
    config.setValue(kSection, "JsonFormatHint", bool_to_string(json_format_hint));

    if (!config.save(config_path)) {
        return false;
    }
    settings_log(spdlog::level::info, "Saved settings to {}", config_path);
    return true;
}


void Settings::validate() const
{
    if (batch_size < 1) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        fmt::format("batch size must be at least 1, got {}", batch_size));
    }
    if (max_attempts < 1) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        fmt::format("max attempts must be at least 1, got {}", max_attempts));
    }
    if (retry_delay_seconds < 0) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        fmt::format("retry delay cannot be negative, got {}", retry_delay_seconds));
    }
    if (request_timeout_seconds < 1) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        fmt::format("request timeout must be at least 1 second, got {}", request_timeout_seconds));
    }
    if (model.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_VALUE, "model identifier is empty");
    }
    if (api_url.empty()) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_VALUE, "endpoint URL is empty");
    }
}


std::string Settings::get_target_dir() const
{
    return target_dir;
}


void Settings::set_target_dir(const std::string& path)
{
    target_dir = path;
}


std::string Settings::get_model() const
{
    return model;
}


void Settings::set_model(const std::string& model)
{
    this->model = model;
}


std::string Settings::get_api_url() const
{
    return api_url;
}


void Settings::set_api_url(const std::string& url)
{
    api_url = url;
}


int Settings::get_batch_size() const
{
    return batch_size;
}


void Settings::set_batch_size(int value)
{
    batch_size = value;
}


int Settings::get_max_attempts() const
{
    return max_attempts;
}


void Settings::set_max_attempts(int value)
{
    max_attempts = value;
}


int Settings::get_retry_delay_seconds() const
{
    return retry_delay_seconds;
}


void Settings::set_retry_delay_seconds(int value)
{
    retry_delay_seconds = value;
}


int Settings::get_request_timeout_seconds() const
{
    return request_timeout_seconds;
}


void Settings::set_request_timeout_seconds(int value)
{
    request_timeout_seconds = value;
}


bool Settings::get_json_format_hint() const
{
    return json_format_hint;
}


void Settings::set_json_format_hint(bool value)
{
    json_format_hint = value;
}
