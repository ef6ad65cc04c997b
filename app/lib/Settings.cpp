#include "Settings.hpp"

#include "Errors.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdlib>

namespace {

std::string normalized(const std::string& value)
{
    return Utils::to_lower_copy(Utils::trim_copy(value));
}

} // namespace

LinkMode Settings::parse_link_mode(const std::string& value)
{
    const std::string v = normalized(value);
    if (v == "symlink") {
        return LinkMode::Symlink;
    }
    if (v == "hardlink") {
        return LinkMode::Hardlink;
    }
    if (v == "copy") {
        return LinkMode::Copy;
    }
    throw ConfigError(fmt::format("link mode must be one of: symlink, hardlink, copy (got '{}')", value));
}

PathDisclosureMode Settings::parse_path_mode(const std::string& value)
{
    const std::string v = normalized(value);
    if (v == "basename") {
        return PathDisclosureMode::Basename;
    }
    if (v == "tail") {
        return PathDisclosureMode::Tail;
    }
    if (v == "full") {
        return PathDisclosureMode::Full;
    }
    throw ConfigError(fmt::format("path mode must be one of: basename, tail, full (got '{}')", value));
}

LLMMode Settings::parse_llm_mode(const std::string& value)
{
    const std::string v = normalized(value);
    if (v == "fallback") {
        return LLMMode::Fallback;
    }
    if (v == "always") {
        return LLMMode::Always;
    }
    throw ConfigError(fmt::format("llm mode must be one of: fallback, always (got '{}')", value));
}

LLMProvider Settings::parse_llm_provider(const std::string& value)
{
    const std::string v = normalized(value);
    if (v.empty() || v == "off") {
        return LLMProvider::Off;
    }
    if (v == "http") {
        return LLMProvider::Http;
    }
    throw ConfigError(fmt::format("llm provider must be one of: off, http (got '{}')", value));
}

LLMSettings Settings::llm_from_environment()
{
    LLMSettings settings;
    if (auto base_url = Utils::getenv_string("DOCVAULT_LLM_BASE_URL")) {
        settings.base_url = Utils::trim_copy(*base_url);
    }
    if (auto model = Utils::getenv_string("DOCVAULT_LLM_MODEL")) {
        settings.model = Utils::trim_copy(*model);
    }
    if (auto timeout = Utils::getenv_string("DOCVAULT_LLM_TIMEOUT")) {
        char* end = nullptr;
        const double parsed = std::strtod(timeout->c_str(), &end);
        if (end == timeout->c_str() || *end != '\0' || !std::isfinite(parsed) || parsed <= 0.0) {
            throw ConfigError(fmt::format("DOCVAULT_LLM_TIMEOUT must be a positive number of seconds (got '{}')",
                                          *timeout));
        }
        settings.timeout_seconds = parsed;
    }
    return settings;
}

void Settings::validate(const CategorizeSettings& settings)
{
    const auto& llm = settings.llm;
    if (!(llm.min_confidence >= 0.0 && llm.min_confidence <= 1.0)) {
        throw ConfigError(fmt::format("min confidence must be within [0, 1] (got {})", llm.min_confidence));
    }
    if (!(llm.timeout_seconds > 0.0)) {
        throw ConfigError("LLM timeout must be positive");
    }
    if (llm.max_output_tokens <= 0) {
        throw ConfigError("max output tokens must be positive");
    }
    if (llm.tail_parts < 1) {
        throw ConfigError("tail parts must be at least 1");
    }
}
