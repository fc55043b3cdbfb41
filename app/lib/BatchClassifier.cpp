#include "BatchClassifier.hpp"

#include "IInferenceClient.hpp"
#include "ResponseParser.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <thread>
#include <utility>

namespace {
constexpr const char* kJsonFormat = "json";

std::string to_json_array(const std::vector<std::string>& values)
{
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, array);
}

std::string format_delay(std::chrono::milliseconds delay)
{
    if (delay.count() % 1000 == 0) {
        return fmt::format("{} seconds", delay.count() / 1000);
    }
    return fmt::format("{} ms", delay.count());
}
} // namespace

BatchClassifier::BatchClassifier(IInferenceClient& client,
                                 ClassifierOptions options,
                                 std::shared_ptr<spdlog::logger> core_logger)
    : client_(client),
      options_(std::move(options)),
      core_logger_(std::move(core_logger)) {}

std::string BatchClassifier::build_prompt(const std::vector<std::string>& file_names)
{
    return fmt::format(
        "Analyze this list of filenames and assign a concise directory name for each.\n"
        "Rules:\n"
        "1. Group files primarily by file extension and type (e.g., all .mp3/.wav files "
        "should go to 'Music' or 'Audio', .jpg/.png to 'Images').\n"
        "2. Do NOT translate Japanese or other non-Latin filenames into English for the "
        "category name. Classify them by their file type only (e.g. 'Music').\n"
        "3. Use specific categories only if they are semantically distinct "
        "(e.g., 'Invoices' vs 'Documents').\n"
        "Return ONLY a JSON object mapping each filename to its directory name.\n"
        "Filenames: {}\n"
        "Example output: {{ \"song.mp3\": \"Music\", \"photo.jpg\": \"Images\", "
        "\"invoice.pdf\": \"Documents\" }}",
        to_json_array(file_names));
}

std::optional<CategoryMapping> BatchClassifier::classify(const Batch& batch,
                                                         const ProgressCallback& progress_callback) const
{
    std::vector<std::string> file_names;
    file_names.reserve(batch.size());
    for (const auto& entry : batch) {
        file_names.push_back(entry.file_name);
    }
    const std::string prompt = build_prompt(file_names);

    const int max_attempts = options_.max_attempts;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (auto mapping = run_attempt(prompt, attempt)) {
            if (core_logger_) {
                core_logger_->info("Batch of {} file(s) classified on attempt {}/{} ({} mapped)",
                                   batch.size(), attempt, max_attempts, mapping->size());
            }
            return mapping;
        }

        if (attempt < max_attempts) {
            if (core_logger_) {
                core_logger_->warn("Retrying in {}...", format_delay(options_.retry_delay));
            }
            if (options_.retry_delay.count() > 0) {
                std::this_thread::sleep_for(options_.retry_delay);
            }
        }
    }

    const std::string message = fmt::format(
        "Failed to process batch after {} attempts. Skipping batch.", max_attempts);
    if (core_logger_) {
        core_logger_->error("{}", message);
    }
    if (progress_callback) {
        progress_callback(message);
    }
    return std::nullopt;
}

std::optional<CategoryMapping> BatchClassifier::run_attempt(const std::string& prompt, int attempt) const
{
    GenerateRequest request;
    request.model = options_.model;
    request.prompt = prompt;
    request.stream = false;
    if (options_.json_format_hint) {
        request.format = kJsonFormat;
    }

    const GenerateResult result = client_.generate(request);
    if (!result.ok()) {
        report_failed_request(result, attempt);
        return std::nullopt;
    }

    ParseResult parsed = ResponseParser::parse(result.text);
    if (!parsed.ok) {
        if (core_logger_) {
            core_logger_->warn("JSON Parse Error (Attempt {}/{}): {}. Response was: {}",
                               attempt, options_.max_attempts, parsed.error_message, parsed.raw_text);
        }
        return std::nullopt;
    }

    return std::move(parsed.mapping);
}

void BatchClassifier::report_failed_request(const GenerateResult& result, int attempt) const
{
    if (!core_logger_) {
        return;
    }

    switch (result.status) {
        case GenerateStatus::TransportError:
            core_logger_->warn("Network Error (Attempt {}/{}): {}",
                               attempt, options_.max_attempts, result.error_message);
            break;
        case GenerateStatus::HttpError:
            core_logger_->warn("API Error (Attempt {}/{}): {} - {}",
                               attempt, options_.max_attempts, result.http_code,
                               result.text.empty() ? "Unknown error" : result.text);
            break;
        case GenerateStatus::EnvelopeError:
            core_logger_->warn("Failed to parse response body (Attempt {}/{}): {}. Body was: {}",
                               attempt, options_.max_attempts, result.error_message, result.text);
            break;
        case GenerateStatus::Ok:
            break;
    }
}
