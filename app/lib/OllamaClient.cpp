#include "OllamaClient.hpp"
#include "Logger.hpp"
#include <curl/curl.h>
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif
#include <memory>
#include <sstream>
#include <utility>

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t total = size * nmemb;
    response->append(static_cast<const char*>(contents), total);
    return total;
}

}

OllamaClient::OllamaClient(std::string api_url, HttpTransport transport)
    : api_url_(std::move(api_url)),
      transport_(std::move(transport))
{
    logger_ = Logger::get_logger("core_logger");
}

void OllamaClient::set_timeout(int seconds) {
    timeout_seconds_ = seconds;
}

std::string OllamaClient::api_url() const {
    return api_url_;
}

std::string OllamaClient::build_payload(const GenerateRequest& request) {
    Json::Value root(Json::objectValue);
    root["model"] = request.model;
    root["prompt"] = request.prompt;
    root["stream"] = request.stream;
    if (request.format) {
        root["format"] = *request.format;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, root);
}

OllamaClient::HttpResponse OllamaClient::perform_post(const std::string& body) const {
    if (transport_) {
        return transport_(api_url_, body, timeout_seconds_);
    }

    HttpResponse result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize cURL";
        return result;
    }

    curl_easy_setopt(curl, CURLOPT_URL, api_url_.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        result.body.clear();
        curl_easy_cleanup(curl);
        return result;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);
    curl_easy_cleanup(curl);
    return result;
}

GenerateResult OllamaClient::decode_envelope(const HttpResponse& response) const {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::istringstream stream(response.body);
    std::string errors;

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        return GenerateResult::envelope_error("Response body is not JSON: " + errors,
                                              response.body, response.status_code);
    }

    if (!root.isObject() || !root["response"].isString()) {
        return GenerateResult::envelope_error("Response body is missing the 'response' string",
                                              response.body, response.status_code);
    }

    return GenerateResult::success(root["response"].asString(), response.status_code);
}

GenerateResult OllamaClient::generate(const GenerateRequest& request) {
    const std::string payload = build_payload(request);

    if (logger_) {
        logger_->debug("POST {} (model '{}', prompt {} chars)", api_url_, request.model, request.prompt.size());
    }

    const HttpResponse response = perform_post(payload);

    if (!response.completed()) {
        if (logger_) {
            logger_->debug("Request to {} failed: {}", api_url_, response.error);
        }
        return GenerateResult::transport_error(response.error);
    }

    if (logger_) {
        logger_->debug("POST {} returned HTTP {}", api_url_, response.status_code);
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        return GenerateResult::http_error(response.status_code, response.body);
    }

    return decode_envelope(response);
}
