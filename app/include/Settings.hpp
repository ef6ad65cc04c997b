#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct ScanSettings {
    std::vector<std::filesystem::path> roots;
    std::vector<std::filesystem::path> excludes;
    bool dry_run = false;
    std::optional<std::size_t> limit;
};

struct LLMSettings {
    LLMProvider provider = LLMProvider::Off;
    std::string base_url = "http://localhost:8000";
    std::string model = "qwen3-4b";
    LLMMode mode = LLMMode::Fallback;
    double min_confidence = 0.6;
    double timeout_seconds = 30.0;
    int max_output_tokens = 200;
    PathDisclosureMode path_mode = PathDisclosureMode::Tail;
    int tail_parts = 3;
};

struct CategorizeSettings {
    std::optional<std::filesystem::path> config_path;
    LinkMode link_mode = LinkMode::Symlink;
    bool refresh_view = true;
    bool recategorize_all = false;
    std::size_t text_sample_bytes = 8192;
    LLMSettings llm;
};

/**
 * @brief Parsing and layering of run settings: built-in defaults, then
 * DOCVAULT_* environment variables, then command-line values. Every parse_*
 * helper throws ConfigError on an unknown value.
 */
class Settings {
public:
    static LinkMode parse_link_mode(const std::string& value);
    static PathDisclosureMode parse_path_mode(const std::string& value);
    static LLMMode parse_llm_mode(const std::string& value);
    static LLMProvider parse_llm_provider(const std::string& value);

    // Defaults overridden by DOCVAULT_LLM_BASE_URL, DOCVAULT_LLM_MODEL and DOCVAULT_LLM_TIMEOUT.
    static LLMSettings llm_from_environment();

    static void validate(const CategorizeSettings& settings);
};

#endif
