/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, scripted endpoint).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "IInferenceClient.hpp"

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    /**
     * @brief Set or unset an environment variable for the guard lifetime.
     * @param key Environment variable name.
     * @param value New value; unset when std::nullopt.
     */
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
        if (value.has_value()) {
            setenv(key_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and cleans it up on destruction.
 */
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("llmsort-test-")) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, std::string_view contents = "data") {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << contents;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Inference client that replays queued results and records requests.
 *
 * Once the queue is empty every further call is a transport error.
 */
class ScriptedInferenceClient : public IInferenceClient {
public:
    void push(GenerateResult result) {
        results_.push_back(std::move(result));
    }

    void push_response(const std::string& text) {
        push(GenerateResult::success(text));
    }

    GenerateResult generate(const GenerateRequest& request) override {
        requests.push_back(request);
        if (results_.empty()) {
            return GenerateResult::transport_error("connection refused");
        }
        GenerateResult next = std::move(results_.front());
        results_.pop_front();
        return next;
    }

    std::size_t calls() const { return requests.size(); }

    std::vector<GenerateRequest> requests;

private:
    std::deque<GenerateResult> results_;
};
