#ifndef CATEGORIZATION_SERVICE_HPP
#define CATEGORIZATION_SERVICE_HPP

#include "Types.hpp"

#include <cstddef>
#include <memory>
#include <string>

class LLMClassifier;
namespace spdlog { class logger; }

struct LLMPolicy {
    LLMMode mode = LLMMode::Fallback;
    double min_confidence = 0.6;
};

struct CategorizationStats {
    int updated = 0;
    int llm_calls = 0;
    int llm_used = 0;
    int llm_failed = 0;
};

/**
 * @brief Per-document categorization: rule scoring first, then an optional LLM opinion.
 *
 * Under LLMMode::Fallback the classifier is consulted only when the rules defaulted or
 * scored below min_score; under LLMMode::Always it is consulted for every document.
 * A confident LLM answer replaces the rule result (score = 10 * confidence); a
 * low-confidence answer or an LLMError only annotates the rule reason.
 */
class CategorizationService {
public:
    static constexpr double kLLMScoreScale = 10.0;
    static constexpr std::size_t kMaxErrorInReason = 200;

    // classifier may be null when no provider is configured.
    CategorizationService(const RuleSet& rules,
                          LLMClassifier* classifier,
                          LLMPolicy policy,
                          std::shared_ptr<spdlog::logger> core_logger);

    Categorization categorize_one(const DocumentAttributes& attributes);

    const CategorizationStats& stats() const { return counters; }

    static bool should_consult_llm(const Categorization& rule_result, const RuleSet& rules, LLMMode mode);

private:
    Categorization consult_llm(const DocumentAttributes& attributes, const Categorization& rule_result);
    std::string llm_label() const;

    const RuleSet& rules;
    LLMClassifier* classifier;
    LLMPolicy policy;
    std::shared_ptr<spdlog::logger> core_logger;
    CategorizationStats counters;
};

#endif
