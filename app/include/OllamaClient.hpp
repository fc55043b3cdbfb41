#pragma once
#include "IInferenceClient.hpp"
#include <functional>
#include <memory>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief Talks to an Ollama-style /api/generate endpoint over libcurl.
 */
class OllamaClient : public IInferenceClient {
public:
    struct HttpResponse {
        long status_code = 0;
        std::string body;
        std::string error; ///< Non-empty when the request never completed.

        bool completed() const { return error.empty(); }
    };

    /// Replaces the libcurl round-trip (tests).
    using HttpTransport = std::function<HttpResponse(const std::string& url,
                                                     const std::string& body,
                                                     int timeout_seconds)>;

    explicit OllamaClient(std::string api_url, HttpTransport transport = {});

    GenerateResult generate(const GenerateRequest& request) override;

    void set_timeout(int seconds);
    std::string api_url() const;

    static std::string build_payload(const GenerateRequest& request);

private:
    std::string api_url_;
    int timeout_seconds_ = 300;
    HttpTransport transport_;
    std::shared_ptr<spdlog::logger> logger_;

    HttpResponse perform_post(const std::string& body) const;
    GenerateResult decode_envelope(const HttpResponse& response) const;
};
