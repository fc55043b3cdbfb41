#ifndef RESPONSE_PARSER_HPP
#define RESPONSE_PARSER_HPP

#include "Types.hpp"
#include <string>
#include <utility>

enum class ParseError {
    None,
    InvalidJson
};

struct ParseResult {
    bool ok = false;
    CategoryMapping mapping;
    ParseError error = ParseError::None;
    std::string error_message;
    std::string raw_text; ///< Untouched model output, kept for diagnostics.

    static ParseResult success(CategoryMapping mapping) {
        ParseResult r;
        r.ok = true;
        r.mapping = std::move(mapping);
        return r;
    }

    static ParseResult invalid_json(const std::string& message, const std::string& raw) {
        ParseResult r;
        r.error = ParseError::InvalidJson;
        r.error_message = message;
        r.raw_text = raw;
        return r;
    }
};

class ResponseParser {
public:
    /**
     * @brief Turns raw model output into a file name -> category mapping.
     *
     * Surrounding whitespace and markdown code fences (```json ... ```) are
     * stripped first. The rest must be a JSON object whose values are all
     * strings; anything else fails the whole parse.
     */
    static ParseResult parse(const std::string& raw_response);

    static std::string strip_code_fences(const std::string& text);
};

#endif
