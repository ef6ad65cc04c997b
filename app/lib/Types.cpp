#include "Types.hpp"

#include <algorithm>
#include <cctype>

std::vector<std::string> RuleSet::category_names() const
{
    std::vector<std::string> names;
    names.reserve(rules.size());
    for (const auto& rule : rules) {
        names.push_back(rule.name);
    }
    return names;
}

bool RuleSet::uses_text() const
{
    return std::any_of(rules.begin(), rules.end(), [](const CategoryRule& rule) {
        return std::any_of(rule.text_keywords.begin(), rule.text_keywords.end(), [](const std::string& kw) {
            return std::any_of(kw.begin(), kw.end(), [](unsigned char ch) { return !std::isspace(ch); });
        });
    });
}

std::string to_string(SourceStatus status)
{
    switch (status) {
    case SourceStatus::Ok:
        return "ok";
    case SourceStatus::Error:
        return "error";
    case SourceStatus::Unreadable:
        return "unreadable";
    }
    return "error";
}

std::optional<SourceStatus> source_status_from_string(const std::string& value)
{
    if (value == "ok") {
        return SourceStatus::Ok;
    }
    if (value == "error") {
        return SourceStatus::Error;
    }
    if (value == "unreadable") {
        return SourceStatus::Unreadable;
    }
    return std::nullopt;
}

std::string to_string(LinkMode mode)
{
    switch (mode) {
    case LinkMode::Symlink:
        return "symlink";
    case LinkMode::Hardlink:
        return "hardlink";
    case LinkMode::Copy:
        return "copy";
    }
    return "symlink";
}

std::string to_string(PathDisclosureMode mode)
{
    switch (mode) {
    case PathDisclosureMode::Basename:
        return "basename";
    case PathDisclosureMode::Tail:
        return "tail";
    case PathDisclosureMode::Full:
        return "full";
    }
    return "tail";
}

std::string to_string(LLMMode mode)
{
    switch (mode) {
    case LLMMode::Fallback:
        return "fallback";
    case LLMMode::Always:
        return "always";
    }
    return "fallback";
}

std::string to_string(LLMProvider provider)
{
    switch (provider) {
    case LLMProvider::Off:
        return "off";
    case LLMProvider::Http:
        return "http";
    }
    return "off";
}
