#include "LLMClassifier.hpp"

#include "ILLMClient.hpp"
#include "Logger.hpp"
#include "ResponseExtractor.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <map>

namespace {

std::string to_json_text(const Json::Value& value)
{
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, value);
}

double parse_confidence(const Json::Value& value)
{
    double parsed = 0.0;
    if (value.isBool() || value.isNull()) {
        return 0.0;
    }
    if (value.isNumeric()) {
        parsed = value.asDouble();
    } else if (value.isString()) {
        const std::string text = Utils::trim_copy(value.asString());
        if (text.empty()) {
            return 0.0;
        }
        char* end = nullptr;
        parsed = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0') {
            return 0.0;
        }
    } else {
        return 0.0;
    }
    if (!std::isfinite(parsed)) {
        return 0.0;
    }
    return std::clamp(parsed, 0.0, 1.0);
}

std::string reason_text(const Json::Value& value)
{
    if (value.isString()) {
        return value.asString();
    }
    if (value.isNumeric()) {
        return Utils::trim_copy(to_json_text(value));
    }
    return std::string();
}

std::string rtrim_copy(std::string value)
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

} // namespace

LLMClassifier::LLMClassifier(ILLMClient& client, LLMClassifierOptions options)
    : client(client),
      options(options) {}

std::string LLMClassifier::provider_name() const
{
    return client.provider_name();
}

std::string LLMClassifier::model_name() const
{
    return client.model_name();
}

std::vector<std::string> LLMClassifier::allowed_categories(const std::vector<std::string>& categories,
                                                           const std::string& default_category)
{
    std::vector<std::string> allowed;
    auto push_unique = [&allowed](const std::string& name) {
        if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
            allowed.push_back(name);
        }
    };
    for (const auto& name : categories) {
        push_unique(name);
    }
    push_unique(default_category);
    return allowed;
}

std::string LLMClassifier::normalize_category_name(const std::string& name)
{
    std::string out;
    out.reserve(name.size());
    bool pending_space = false;
    for (unsigned char ch : name) {
        const char lower = static_cast<char>(std::tolower(ch));
        if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9')) {
            if (pending_space && !out.empty()) {
                out.push_back(' ');
            }
            pending_space = false;
            out.push_back(lower);
        } else {
            pending_space = true;
        }
    }
    return out;
}

std::optional<std::string> LLMClassifier::format_source_path(const std::optional<std::string>& path,
                                                             PathDisclosureMode mode,
                                                             int tail_parts,
                                                             const std::optional<std::string>& home)
{
    if (!path || path->empty()) {
        return std::nullopt;
    }
    const std::filesystem::path p(*path);

    switch (mode) {
    case PathDisclosureMode::Basename:
        return p.filename().string();
    case PathDisclosureMode::Full:
        return Utils::abbreviate_user_path(*path, home);
    case PathDisclosureMode::Tail:
        break;
    }

    std::vector<std::string> parts;
    for (const auto& part : p.relative_path()) {
        if (!part.empty()) {
            parts.push_back(part.string());
        }
    }
    const std::size_t keep = static_cast<std::size_t>(std::max(1, tail_parts));
    const std::size_t first = parts.size() > keep ? parts.size() - keep : 0;

    std::string tail;
    for (std::size_t i = first; i < parts.size(); ++i) {
        if (!tail.empty()) {
            tail.push_back('/');
        }
        tail += parts[i];
    }
    return "\xE2\x80\xA6/" + tail;
}

std::string LLMClassifier::build_prompt(const DocumentAttributes& attributes,
                                        const std::vector<std::string>& allowed,
                                        const std::string& default_category,
                                        std::size_t max_text_bytes)
{
    Json::Value categories(Json::arrayValue);
    for (const auto& name : allowed) {
        categories.append(name);
    }

    std::vector<std::string> lines{
        "You are a precise document librarian.",
        "Pick the single best category for this PDF from the allowed list.",
        "Return ONLY valid JSON (no markdown) with keys: category, confidence, reason.",
        "- category must be exactly one of: " + to_json_text(categories),
        "- confidence must be a number between 0 and 1.",
        "- reason must be short (<= 140 chars).",
        "If unsure, use category=" + to_json_text(Json::Value(default_category)) + " with low confidence.",
        "",
        "PDF info:",
    };

    auto add = [&lines](const char* key, const std::optional<std::string>& value) {
        if (value && !value->empty()) {
            lines.push_back(fmt::format("- {}: {}", key, *value));
        }
    };
    add("source_path", attributes.source_path);
    add("filename", attributes.source_basename);
    add("title", attributes.title);
    add("authors", attributes.authors);
    add("subject", attributes.subject);
    add("keywords", attributes.keywords);
    if (attributes.page_count) {
        lines.push_back(fmt::format("- pages: {}", *attributes.page_count));
    }
    if (attributes.text_sample) {
        const std::string sample = Utils::truncate_utf8(
            Utils::trim_copy(Utils::collapse_whitespace(*attributes.text_sample)), max_text_bytes);
        if (!sample.empty()) {
            lines.push_back("- text_sample: " + sample);
        }
    }

    std::string prompt;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            prompt.push_back('\n');
        }
        prompt += lines[i];
    }
    return Utils::trim_copy(prompt) + "\n";
}

LLMClassification LLMClassifier::interpret_reply(const std::string& raw_text,
                                                 const std::vector<std::string>& allowed,
                                                 const std::string& default_category,
                                                 double elapsed_seconds)
{
    const Json::Value parsed = ResponseExtractor::extract(raw_text);

    LLMClassification result;
    result.raw_text = raw_text;

    const Json::Value& category = parsed["category"];
    std::map<std::string, std::string> by_normalized;
    for (const auto& name : allowed) {
        by_normalized[normalize_category_name(name)] = name;
    }

    const auto match = category.isString()
                           ? by_normalized.find(normalize_category_name(category.asString()))
                           : by_normalized.end();
    if (match == by_normalized.end()) {
        result.category = default_category;
        result.confidence = 0.0;
        result.reason = kInvalidCategoryReason;
        return result;
    }

    result.category = match->second;
    result.confidence = parse_confidence(parsed["confidence"]);

    std::string reason = Utils::trim_copy(reason_text(parsed["reason"]));
    if (reason.size() > kMaxReasonLength) {
        reason = rtrim_copy(Utils::truncate_utf8(reason, kMaxReasonLength));
    }
    if (reason.empty()) {
        reason = fmt::format("llm classified in {:.2f}s", elapsed_seconds);
    }
    result.reason = reason;
    return result;
}

LLMClassification LLMClassifier::classify(const DocumentAttributes& attributes,
                                          const std::vector<std::string>& categories,
                                          const std::string& default_category)
{
    const auto allowed = allowed_categories(categories, default_category);

    DocumentAttributes disclosed = attributes;
    disclosed.source_path = format_source_path(attributes.source_path, options.path_mode,
                                               options.tail_parts, Utils::home_directory());

    const std::string prompt = build_prompt(disclosed, allowed, default_category, options.max_prompt_text_bytes);

    const auto started = std::chrono::steady_clock::now();
    const std::string raw_text = client.complete_prompt(prompt, options.max_output_tokens);
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    LLMClassification result = interpret_reply(raw_text, allowed, default_category, elapsed);
    if (auto logger = Logger::get_logger(Logger::kLLMLogger)) {
        logger->debug("{} -> {} (conf={:.2f}, {:.2f}s)",
                      attributes.source_basename.value_or("<unknown>"),
                      result.category, result.confidence, elapsed);
    }
    return result;
}
