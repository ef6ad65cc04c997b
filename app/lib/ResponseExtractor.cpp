#include "ResponseExtractor.hpp"

#include "Utils.hpp"

#include <json/json.h>

#include <cctype>
#include <memory>
#include <regex>
#include <sstream>
#include <vector>

namespace {

bool starts_with_fence_lang(const std::string& line, std::size_t pos)
{
    static const std::string kLang = "json";
    if (line.size() < pos + kLang.size()) {
        return false;
    }
    for (std::size_t i = 0; i < kLang.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[pos + i])) != kLang[i]) {
            return false;
        }
    }
    return true;
}

std::string rtrim_copy(std::string value)
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

std::string ltrim_copy(const std::string& value)
{
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    return value.substr(start);
}

void replace_all(std::string& text, const std::string& from, const std::string& to)
{
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::optional<std::string> search_group(const std::string& text, const std::regex& pattern)
{
    std::smatch match;
    if (std::regex_search(text, match, pattern) && match.size() > 1) {
        return match[1].str();
    }
    return std::nullopt;
}

} // namespace

std::string ResponseExtractor::strip_code_fences(const std::string& text)
{
    // Fence markers are removed at line starts (``` or ```json) and line ends (```).
    std::istringstream in(Utils::trim_copy(text));
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("```", 0) == 0) {
            std::size_t pos = 3;
            if (starts_with_fence_lang(line, pos)) {
                pos += 4;
            }
            line = ltrim_copy(line.substr(pos));
        }
        const std::string trimmed = rtrim_copy(line);
        if (trimmed.size() >= 3 && trimmed.compare(trimmed.size() - 3, 3, "```") == 0) {
            line = rtrim_copy(trimmed.substr(0, trimmed.size() - 3));
        }
        lines.push_back(line);
    }

    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined += lines[i];
    }
    return Utils::trim_copy(joined);
}

std::string ResponseExtractor::normalize_smart_quotes(const std::string& text)
{
    std::string out = text;
    replace_all(out, "\xE2\x80\x9C", "\"");
    replace_all(out, "\xE2\x80\x9D", "\"");
    replace_all(out, "\xE2\x80\x98", "'");
    replace_all(out, "\xE2\x80\x99", "'");
    return out;
}

std::optional<Json::Value> ResponseExtractor::parse_object(const std::string& text,
                                                           bool allow_trailing,
                                                           bool allow_single_quotes)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowComments"] = false;
    builder["failIfExtra"] = !allow_trailing;
    builder["allowSingleQuotes"] = allow_single_quotes;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value value;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
        return std::nullopt;
    }
    if (!value.isObject()) {
        return std::nullopt;
    }
    return value;
}

std::optional<Json::Value> ResponseExtractor::parse_whole_object(const std::string& text)
{
    if (text.empty() || text.front() != '{' || text.back() != '}') {
        return std::nullopt;
    }
    return parse_object(text, false, false);
}

std::optional<Json::Value> ResponseExtractor::scan_embedded_objects(const std::string& text)
{
    std::vector<Json::Value> candidates;
    for (std::size_t pos = text.find('{'); pos != std::string::npos; pos = text.find('{', pos + 1)) {
        if (auto parsed = parse_object(text.substr(pos), true, false)) {
            candidates.push_back(std::move(*parsed));
        }
    }
    for (const auto& candidate : candidates) {
        if (candidate.isMember("category") && candidate["category"].isString()) {
            return candidate;
        }
    }
    if (!candidates.empty()) {
        return candidates.front();
    }
    return std::nullopt;
}

std::optional<Json::Value> ResponseExtractor::parse_outer_span(const std::string& text)
{
    const auto start = text.find('{');
    const auto end = text.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end <= start) {
        return std::nullopt;
    }
    const std::string span = text.substr(start, end - start + 1);
    if (auto strict = parse_object(span, false, false)) {
        return strict;
    }
    return parse_object(span, false, true);
}

Json::Value ResponseExtractor::extract_fields_by_pattern(const std::string& text)
{
    static const std::regex kCategory(R"(category['"]?\s*[:=]\s*['"]([^'"]+)['"])", std::regex::icase);
    static const std::regex kConfidence(R"(confidence['"]?\s*[:=]\s*([0-9]*\.?[0-9]+))", std::regex::icase);
    static const std::regex kReason(R"(reason['"]?\s*[:=]\s*['"]([^'"]+)['"])", std::regex::icase);

    Json::Value out(Json::objectValue);
    if (auto category = search_group(text, kCategory)) {
        out["category"] = Utils::trim_copy(*category);
    }
    if (auto confidence = search_group(text, kConfidence)) {
        out["confidence"] = *confidence;
    }
    if (auto reason = search_group(text, kReason)) {
        out["reason"] = Utils::trim_copy(*reason);
    }
    return out;
}

Json::Value ResponseExtractor::extract(const std::string& text)
{
    const std::string cleaned = normalize_smart_quotes(strip_code_fences(text));
    if (cleaned.empty()) {
        return Json::Value(Json::objectValue);
    }
    if (auto whole = parse_whole_object(cleaned)) {
        return *whole;
    }
    if (auto embedded = scan_embedded_objects(cleaned)) {
        return *embedded;
    }
    if (auto span = parse_outer_span(cleaned)) {
        return *span;
    }
    return extract_fields_by_pattern(cleaned);
}
