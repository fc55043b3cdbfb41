#pragma once
#include <optional>
#include <string>
#include <utility>

struct GenerateRequest {
    std::string model;
    std::string prompt;
    bool stream = false;
    std::optional<std::string> format; ///< "json" asks the endpoint to constrain output.
};

enum class GenerateStatus {
    Ok,
    TransportError,   ///< Could not reach the endpoint.
    HttpError,        ///< Non-2xx status.
    EnvelopeError     ///< 2xx, but the body is not {"response": "..."}.
};

struct GenerateResult {
    GenerateStatus status = GenerateStatus::TransportError;
    std::string text;          ///< Model output when ok, offending body otherwise.
    std::string error_message;
    long http_code = 0;

    bool ok() const { return status == GenerateStatus::Ok; }

    static GenerateResult success(std::string text, long http_code = 200) {
        return {GenerateStatus::Ok, std::move(text), "", http_code};
    }

    static GenerateResult transport_error(const std::string& msg) {
        return {GenerateStatus::TransportError, "", msg, 0};
    }

    static GenerateResult http_error(long code, std::string body) {
        return {GenerateStatus::HttpError, std::move(body), "HTTP " + std::to_string(code), code};
    }

    static GenerateResult envelope_error(const std::string& msg, std::string body, long code) {
        return {GenerateStatus::EnvelopeError, std::move(body), msg, code};
    }
};

class IInferenceClient {
public:
    virtual ~IInferenceClient() = default;
    virtual GenerateResult generate(const GenerateRequest& request) = 0;
};
