#ifndef BATCH_CLASSIFIER_HPP
#define BATCH_CLASSIFIER_HPP

#include "Types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class IInferenceClient;
struct GenerateResult;
namespace spdlog { class logger; }

struct ClassifierOptions {
    std::string model;
    int max_attempts{3};
    std::chrono::milliseconds retry_delay{std::chrono::seconds(2)};
    bool json_format_hint{true};
};

class BatchClassifier {
public:
    using ProgressCallback = std::function<void(const std::string&)>;

    BatchClassifier(IInferenceClient& client,
                    ClassifierOptions options,
                    std::shared_ptr<spdlog::logger> core_logger);

    /**
     * @brief Asks the model for a category per file of the batch.
     *
     * Runs up to max_attempts attempts with a fixed delay in between and
     * returns the first mapping that parses. Returns std::nullopt once every
     * attempt has failed; the caller must then leave the whole batch alone.
     */
    std::optional<CategoryMapping> classify(const Batch& batch,
                                            const ProgressCallback& progress_callback = {}) const;

    static std::string build_prompt(const std::vector<std::string>& file_names);

private:
    std::optional<CategoryMapping> run_attempt(const std::string& prompt, int attempt) const;
    void report_failed_request(const GenerateResult& result, int attempt) const;

    IInferenceClient& client_;
    ClassifierOptions options_;
    std::shared_ptr<spdlog::logger> core_logger_;
};

#endif
