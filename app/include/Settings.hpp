#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <filesystem>
#include <string>


class Settings
{
public:
    static constexpr const char* kDefaultTargetDir = ".";
    static constexpr const char* kDefaultModel = "gpt-oss:20b-cloud";
    static constexpr const char* kDefaultApiUrl = "http://localhost:11434/api/generate";
    static constexpr int kDefaultBatchSize = 15;
    static constexpr int kDefaultMaxAttempts = 3;
    static constexpr int kDefaultRetryDelaySeconds = 2;
    static constexpr int kDefaultRequestTimeoutSeconds = 300;

    Settings();

    bool load();
    bool save();

    /// Throws ErrorCodes::AppException(CONFIG_INVALID_VALUE) on the first bad value.
    void validate() const;

    std::string get_target_dir() const;
    void set_target_dir(const std::string& path);

    std::string get_model() const;
    void set_model(const std::string& model);

    std::string get_api_url() const;
    void set_api_url(const std::string& url);

    int get_batch_size() const;
    void set_batch_size(int value);

    int get_max_attempts() const;
    void set_max_attempts(int value);

    int get_retry_delay_seconds() const;
    void set_retry_delay_seconds(int value);

    int get_request_timeout_seconds() const;
    void set_request_timeout_seconds(int value);

    bool get_json_format_hint() const;
    void set_json_format_hint(bool value);

    std::string define_config_path() const;
    std::string get_config_path() const;

private:
    std::string config_path;
    IniConfig config;

    std::string target_dir{kDefaultTargetDir};
    std::string model{kDefaultModel};
    std::string api_url{kDefaultApiUrl};
    int batch_size{kDefaultBatchSize};
    int max_attempts{kDefaultMaxAttempts};
    int retry_delay_seconds{kDefaultRetryDelaySeconds};
    int request_timeout_seconds{kDefaultRequestTimeoutSeconds};
    bool json_format_hint{true};
};

#endif
