#ifndef CATEGORY_CONFIG_HPP
#define CATEGORY_CONFIG_HPP

#include "Types.hpp"

#include <filesystem>
#include <string>

/**
 * @brief Loads and validates the categories.json rule-set document.
 *
 * Accepted keys: default_category, min_score and categories[], each category with
 * name, priority, min_pages, max_pages and the four *_keywords_any arrays.
 * Malformed JSON or wrongly typed values raise ConfigError; categories with a
 * blank name are skipped with a warning.
 */
class CategoryConfig {
public:
    static RuleSet load_file(const std::filesystem::path& path);
    static RuleSet parse(const std::string& json_text, const std::string& origin = "<inline>");

    // Rule set written by `init` when the library has none yet.
    static const std::string& default_config_json();
};

#endif
