#ifndef RULE_SCORER_HPP
#define RULE_SCORER_HPP

#include "Types.hpp"

#include <string>
#include <vector>

/**
 * @brief Deterministic keyword scoring of a document against a rule set.
 *
 * Each rule accumulates weight from four channels (path 2.0, filename 2.0,
 * metadata 3.0, text 4.0, plus 0.25 per additional hit in the channel) and a
 * priority * 1e-6 tie-breaker. The best rule is replaced only on a strictly
 * greater score. Rules whose page bounds exclude the document are skipped.
 */
class RuleScorer {
public:
    static constexpr double kPathWeight = 2.0;
    static constexpr double kFilenameWeight = 2.0;
    static constexpr double kMetadataWeight = 3.0;
    static constexpr double kTextWeight = 4.0;
    static constexpr double kExtraHitWeight = 0.25;
    static constexpr double kPriorityScale = 1e-6;

    static constexpr const char* kNoRulesMatched = "no rules matched";
    static constexpr const char* kBelowMinScore = "below min_score; defaulted";

    static Categorization score(const DocumentAttributes& attributes, const RuleSet& rules);

    // Keywords found (case-insensitively) in the haystack, in configured order.
    static std::vector<std::string> keyword_hits(const std::string& haystack,
                                                 const std::vector<std::string>& keywords);

private:
    static bool page_bounds_exclude(const CategoryRule& rule, const std::optional<int>& page_count);
};

#endif
