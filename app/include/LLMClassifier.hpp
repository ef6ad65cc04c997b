#ifndef LLM_CLASSIFIER_HPP
#define LLM_CLASSIFIER_HPP

#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

class ILLMClient;

struct LLMClassification {
    std::string category;
    double confidence = 0.0;
    std::string reason;
    std::string raw_text;
};

struct LLMClassifierOptions {
    PathDisclosureMode path_mode = PathDisclosureMode::Tail;
    int tail_parts = 3;
    int max_output_tokens = 200;
    std::size_t max_prompt_text_bytes = 8192;
};

/**
 * @brief Asks a completion provider to pick one category from an allow-list.
 *
 * Content problems in the reply (unknown category, missing confidence) are folded
 * into a default-category result; transport failures from the client propagate
 * as LLMError.
 */
class LLMClassifier {
public:
    static constexpr std::size_t kMaxReasonLength = 200;
    static constexpr const char* kInvalidCategoryReason = "missing/invalid category; defaulted";

    LLMClassifier(ILLMClient& client, LLMClassifierOptions options);

    LLMClassification classify(const DocumentAttributes& attributes,
                               const std::vector<std::string>& categories,
                               const std::string& default_category);

    std::string provider_name() const;
    std::string model_name() const;

    static std::vector<std::string> allowed_categories(const std::vector<std::string>& categories,
                                                       const std::string& default_category);

    static std::string build_prompt(const DocumentAttributes& attributes,
                                    const std::vector<std::string>& allowed,
                                    const std::string& default_category,
                                    std::size_t max_text_bytes);

    static std::optional<std::string> format_source_path(const std::optional<std::string>& path,
                                                         PathDisclosureMode mode,
                                                         int tail_parts,
                                                         const std::optional<std::string>& home);

    static std::string normalize_category_name(const std::string& name);

    static LLMClassification interpret_reply(const std::string& raw_text,
                                             const std::vector<std::string>& allowed,
                                             const std::string& default_category,
                                             double elapsed_seconds);

private:
    ILLMClient& client;
    LLMClassifierOptions options;
};

#endif
