#include "ResponseParser.hpp"
#include "Utils.hpp"
#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif
#include <memory>
#include <string_view>

namespace {
constexpr std::string_view kFence = "```";
constexpr std::string_view kJsonTag = "json";
}


std::string ResponseParser::strip_code_fences(const std::string& text)
{
    std::string body = Utils::trim_copy(text);

    if (body.starts_with(kFence)) {
        body.erase(0, kFence.size());
        if (body.starts_with(kJsonTag)) {
            body.erase(0, kJsonTag.size());
        } else if (const auto line_end = body.find('\n'); line_end != std::string::npos) {
            // Any other language tag runs to the end of the opening line.
            const std::string tag = Utils::trim_copy(body.substr(0, line_end));
            if (!tag.empty() && tag.find_first_of("{[\"") == std::string::npos) {
                body.erase(0, line_end + 1);
            }
        }
        body = Utils::trim_copy(body);
    }

    if (body.ends_with(kFence)) {
        body.erase(body.size() - kFence.size());
    }

    return Utils::trim_copy(body);
}


ParseResult ResponseParser::parse(const std::string& raw_response)
{
    const std::string cleaned = strip_code_fences(raw_response);

    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    // The model repeating a file name is harmless; the last value wins.
    builder["rejectDupKeys"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(cleaned.data(), cleaned.data() + cleaned.size(), &root, &errors)) {
        return ParseResult::invalid_json(Utils::trim_copy(errors), raw_response);
    }

    if (!root.isObject()) {
        return ParseResult::invalid_json("expected a JSON object of file name to category", raw_response);
    }

    CategoryMapping mapping;
    for (const auto& name : root.getMemberNames()) {
        const Json::Value& value = root[name];
        if (!value.isString()) {
            return ParseResult::invalid_json("value for '" + name + "' is not a string", raw_response);
        }
        mapping.emplace(name, value.asString());
    }

    return ParseResult::success(std::move(mapping));
}
