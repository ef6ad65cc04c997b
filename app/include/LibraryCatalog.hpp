#ifndef LIBRARY_CATALOG_HPP
#define LIBRARY_CATALOG_HPP

#include "CategorizationService.hpp"
#include "Types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

class DatabaseManager;
class IMetadataExtractor;
class Library;
class LLMClassifier;
namespace spdlog { class logger; }

struct CatalogOptions {
    LinkMode link_mode = LinkMode::Symlink;
    bool refresh_view = true;
    bool recategorize_all = false;
    std::size_t text_sample_bytes = 8192;
};

struct CatalogReport {
    int docs_categorized = 0;
    int links_created = 0;
    int llm_calls = 0;
    int llm_used = 0;
    int llm_failed = 0;
    std::map<std::string, int> per_category;

    // Flat key/count view: the counters plus one "cat:<Category>" entry per category.
    std::map<std::string, int> as_map() const;
};

/**
 * @brief The categorize pass: refreshes metadata for pending documents, categorizes them,
 * persists the results and rebuilds the categorized view from the full document set.
 * Runs as one manifest transaction committed after the view is rebuilt.
 */
class LibraryCatalog {
public:
    LibraryCatalog(const Library& library,
                   DatabaseManager& db_manager,
                   IMetadataExtractor& extractor,
                   std::shared_ptr<spdlog::logger> core_logger);

    CatalogReport categorize(const RuleSet& rules,
                             LLMClassifier* classifier,
                             const LLMPolicy& policy,
                             const CatalogOptions& options);

    // Title, else the latest source basename without ".pdf", else the first 12 digest characters.
    static std::string display_name(const Document& doc,
                                    const std::unordered_map<std::string, LatestSource>& latest_sources);

private:
    DocumentAttributes refresh_metadata(const Document& doc,
                                        const std::unordered_map<std::string, LatestSource>& latest_sources,
                                        bool use_text,
                                        std::size_t text_sample_bytes);

    const Library& library;
    DatabaseManager& db_manager;
    IMetadataExtractor& extractor;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
