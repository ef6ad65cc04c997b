#include "CategorizationService.hpp"

#include "LLMClassifier.hpp"
#include "LLMErrors.hpp"
#include "RuleScorer.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

CategorizationService::CategorizationService(const RuleSet& rules,
                                             LLMClassifier* classifier,
                                             LLMPolicy policy,
                                             std::shared_ptr<spdlog::logger> core_logger)
    : rules(rules),
      classifier(classifier),
      policy(policy),
      core_logger(std::move(core_logger)) {}

bool CategorizationService::should_consult_llm(const Categorization& rule_result,
                                               const RuleSet& rules,
                                               LLMMode mode)
{
    if (mode == LLMMode::Always) {
        return true;
    }
    return rule_result.category == rules.default_category ||
           rule_result.reason.rfind("below min_score", 0) == 0 ||
           rule_result.score < rules.min_score;
}

std::string CategorizationService::llm_label() const
{
    return fmt::format("llm:{}/{}", classifier->provider_name(), classifier->model_name());
}

Categorization CategorizationService::consult_llm(const DocumentAttributes& attributes,
                                                  const Categorization& rule_result)
{
    ++counters.llm_calls;
    try {
        const auto answer = classifier->classify(attributes, rules.category_names(), rules.default_category);
        if (answer.confidence >= policy.min_confidence) {
            ++counters.llm_used;
            return Categorization{
                answer.category,
                kLLMScoreScale * answer.confidence,
                fmt::format("{} conf={:.2f}; {}", llm_label(), answer.confidence, answer.reason)};
        }
        if (core_logger) {
            core_logger->debug("LLM suggested '{}' with low confidence {:.2f}; keeping '{}'",
                               answer.category, answer.confidence, rule_result.category);
        }
        return Categorization{
            rule_result.category,
            rule_result.score,
            fmt::format("{} | {} low_conf={:.2f}", rule_result.reason, llm_label(), answer.confidence)};
    } catch (const LLMError& ex) {
        ++counters.llm_failed;
        if (core_logger) {
            core_logger->warn("LLM call failed for '{}': {}",
                              attributes.source_basename.value_or("<unknown>"), ex.what());
        }
        return Categorization{
            rule_result.category,
            rule_result.score,
            fmt::format("{} | llm_error:{}", rule_result.reason, Utils::truncate_utf8(ex.what(), kMaxErrorInReason))};
    }
}

Categorization CategorizationService::categorize_one(const DocumentAttributes& attributes)
{
    Categorization result = RuleScorer::score(attributes, rules);
    if (classifier && should_consult_llm(result, rules, policy.mode)) {
        result = consult_llm(attributes, result);
    }
    ++counters.updated;

    if (core_logger) {
        core_logger->debug("{} -> {} ({:.3f}; {})",
                           attributes.source_basename.value_or("<unknown>"),
                           result.category, result.score, result.reason);
    }
    return result;
}
