#ifndef RESPONSE_EXTRACTOR_HPP
#define RESPONSE_EXTRACTOR_HPP

#include <optional>
#include <string>

#include <json/value.h>

/**
 * @brief Best-effort recovery of a JSON object from free-form model output.
 *
 * Strategies run in order and the first one that yields an object wins:
 *   1. strip code fences and normalize smart quotes (always applied),
 *   2. parse the whole text when it is a single brace-delimited object,
 *   3. parse at every '{' and prefer the first object with a string "category",
 *   4. parse the span between the first '{' and the last '}', strictly and then
 *      tolerating single-quoted strings,
 *   5. pattern-match category / confidence / reason fields individually.
 *
 * extract() never throws on malformed input; it returns an empty object when
 * nothing could be recovered.
 */
class ResponseExtractor {
public:
    static Json::Value extract(const std::string& text);

    static std::string strip_code_fences(const std::string& text);
    static std::string normalize_smart_quotes(const std::string& text);

    static std::optional<Json::Value> parse_whole_object(const std::string& text);
    static std::optional<Json::Value> scan_embedded_objects(const std::string& text);
    static std::optional<Json::Value> parse_outer_span(const std::string& text);
    static Json::Value extract_fields_by_pattern(const std::string& text);

private:
    static std::optional<Json::Value> parse_object(const std::string& text,
                                                   bool allow_trailing,
                                                   bool allow_single_quotes);
};

#endif
