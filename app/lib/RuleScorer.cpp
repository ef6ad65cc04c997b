#include "RuleScorer.hpp"

#include "Utils.hpp"

#include <fmt/format.h>

namespace {

std::string lowered(const std::optional<std::string>& value)
{
    return value ? Utils::to_lower_copy(*value) : std::string();
}

double channel_score(double base, std::size_t hits)
{
    if (hits == 0) {
        return 0.0;
    }
    return base + RuleScorer::kExtraHitWeight * static_cast<double>(hits - 1);
}

std::string join(const std::vector<std::string>& parts, const char* separator)
{
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

} // namespace

std::vector<std::string> RuleScorer::keyword_hits(const std::string& haystack,
                                                  const std::vector<std::string>& keywords)
{
    const std::string lowered_haystack = Utils::to_lower_copy(haystack);
    std::vector<std::string> hits;
    for (const auto& keyword : keywords) {
        const std::string needle = Utils::to_lower_copy(Utils::trim_copy(keyword));
        if (needle.empty()) {
            continue;
        }
        if (lowered_haystack.find(needle) != std::string::npos) {
            hits.push_back(keyword);
        }
    }
    return hits;
}

bool RuleScorer::page_bounds_exclude(const CategoryRule& rule, const std::optional<int>& page_count)
{
    if (!page_count) {
        return false;
    }
    if (rule.min_pages && *page_count < *rule.min_pages) {
        return true;
    }
    return rule.max_pages && *page_count > *rule.max_pages;
}

Categorization RuleScorer::score(const DocumentAttributes& attributes, const RuleSet& rules)
{
    const std::string path = lowered(attributes.source_path);
    const std::string basename = lowered(attributes.source_basename);
    const std::string metadata = fmt::format("{} {} {} {}",
                                             lowered(attributes.title),
                                             lowered(attributes.subject),
                                             lowered(attributes.keywords),
                                             lowered(attributes.authors));
    const std::string text = lowered(attributes.text_sample);

    bool any_rule_fired = false;
    Categorization best{rules.default_category, 0.0, kNoRulesMatched};

    for (const auto& rule : rules.rules) {
        if (rule.name.empty() || page_bounds_exclude(rule, attributes.page_count)) {
            continue;
        }

        double total = 0.0;
        std::vector<std::string> reasons;

        const auto path_hits = keyword_hits(path, rule.path_keywords);
        if (!path_hits.empty()) {
            total += channel_score(kPathWeight, path_hits.size());
            reasons.push_back("path:" + path_hits.front());
        }
        const auto file_hits = keyword_hits(basename, rule.filename_keywords);
        if (!file_hits.empty()) {
            total += channel_score(kFilenameWeight, file_hits.size());
            reasons.push_back("filename:" + file_hits.front());
        }
        const auto meta_hits = keyword_hits(metadata, rule.metadata_keywords);
        if (!meta_hits.empty()) {
            total += channel_score(kMetadataWeight, meta_hits.size());
            reasons.push_back("meta:" + meta_hits.front());
        }
        const auto text_hits = keyword_hits(text, rule.text_keywords);
        if (!text_hits.empty()) {
            total += channel_score(kTextWeight, text_hits.size());
            reasons.push_back("text:" + text_hits.front());
        }

        if (reasons.empty()) {
            continue;
        }
        total += rule.priority * kPriorityScale;

        if (!any_rule_fired || total > best.score) {
            best = Categorization{rule.name, total, join(reasons, ", ")};
            any_rule_fired = true;
        }
    }

    if (!any_rule_fired) {
        return Categorization{rules.default_category, 0.0, kNoRulesMatched};
    }
    if (best.score < rules.min_score) {
        return Categorization{rules.default_category, best.score, kBelowMinScore};
    }
    return best;
}
