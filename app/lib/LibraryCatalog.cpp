#include "LibraryCatalog.hpp"

#include "DatabaseManager.hpp"
#include "Library.hpp"
#include "MetadataExtractor.hpp"
#include "Utils.hpp"
#include "ViewBuilder.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace {

bool has_text(const std::optional<std::string>& value)
{
    return value && !Utils::trim_copy(*value).empty();
}

std::string strip_pdf_suffix(const std::string& name)
{
    const std::string lower = Utils::to_lower_copy(name);
    if (lower.size() >= 4 && lower.compare(lower.size() - 4, 4, ".pdf") == 0) {
        return name.substr(0, name.size() - 4);
    }
    return name;
}

} // namespace

std::map<std::string, int> CatalogReport::as_map() const
{
    std::map<std::string, int> out{
        {"docs_categorized", docs_categorized},
        {"links_created", links_created},
        {"llm_calls", llm_calls},
        {"llm_used", llm_used},
        {"llm_failed", llm_failed},
    };
    for (const auto& [category, count] : per_category) {
        out["cat:" + category] = count;
    }
    return out;
}

LibraryCatalog::LibraryCatalog(const Library& library,
                               DatabaseManager& db_manager,
                               IMetadataExtractor& extractor,
                               std::shared_ptr<spdlog::logger> core_logger)
    : library(library),
      db_manager(db_manager),
      extractor(extractor),
      core_logger(std::move(core_logger)) {}

std::string LibraryCatalog::display_name(const Document& doc,
                                         const std::unordered_map<std::string, LatestSource>& latest_sources)
{
    if (has_text(doc.metadata.title)) {
        return *doc.metadata.title;
    }
    const auto it = latest_sources.find(doc.digest);
    if (it != latest_sources.end() && !it->second.basename.empty()) {
        return strip_pdf_suffix(it->second.basename);
    }
    return doc.digest.substr(0, 12);
}

DocumentAttributes LibraryCatalog::refresh_metadata(const Document& doc,
                                                    const std::unordered_map<std::string, LatestSource>& latest_sources,
                                                    bool use_text,
                                                    std::size_t text_sample_bytes)
{
    const std::filesystem::path stored = library.root() / doc.store_relative_path;

    DocumentMetadata metadata = extractor.read_metadata(stored);
    metadata.text_sample = use_text ? extractor.read_text_sample(stored, text_sample_bytes) : std::nullopt;
    db_manager.update_document_metadata(doc.digest, metadata);

    DocumentAttributes attributes;
    const auto source = latest_sources.find(doc.digest);
    if (source != latest_sources.end()) {
        attributes.source_path = source->second.path;
        attributes.source_basename = source->second.basename;
    }
    if (!has_text(attributes.source_basename)) {
        attributes.source_basename = stored.filename().string();
    }
    attributes.title = metadata.title;
    attributes.subject = metadata.subject;
    attributes.keywords = metadata.keywords;
    attributes.authors = metadata.authors;
    attributes.text_sample = metadata.text_sample;
    attributes.page_count = metadata.page_count;
    return attributes;
}

CatalogReport LibraryCatalog::categorize(const RuleSet& rules,
                                         LLMClassifier* classifier,
                                         const LLMPolicy& policy,
                                         const CatalogOptions& options)
{
    const bool use_text = (rules.uses_text() || classifier != nullptr) && options.text_sample_bytes > 0;
    CategorizationService service(rules, classifier, policy, core_logger);

    DatabaseManager::Transaction transaction(db_manager);

    const auto latest_sources = db_manager.latest_sources_by_digest();
    const auto pending = db_manager.get_documents(options.recategorize_all ? DocumentFilter::All
                                                                          : DocumentFilter::Uncategorized);
    if (core_logger) {
        core_logger->info("Categorizing {} document(s){}", pending.size(),
                          use_text ? " with text samples" : "");
    }

    const double now = Utils::now_ts();
    for (const auto& doc : pending) {
        const DocumentAttributes attributes =
            refresh_metadata(doc, latest_sources, use_text, options.text_sample_bytes);
        const Categorization result = service.categorize_one(attributes);
        db_manager.update_document_category(doc.digest, result, now);

        const int done = service.stats().updated;
        if (core_logger && done % 250 == 0) {
            core_logger->info("categorized {}...", done);
        }
    }

    const auto all_documents = db_manager.get_documents(DocumentFilter::All);
    ViewBuilder view(library);
    auto counts = view.rebuild(
        all_documents,
        options.link_mode,
        [&latest_sources](const Document& doc) { return display_name(doc, latest_sources); },
        options.refresh_view,
        rules.default_category);

    transaction.commit();

    CatalogReport report;
    const auto& stats = service.stats();
    report.docs_categorized = stats.updated;
    report.llm_calls = stats.llm_calls;
    report.llm_used = stats.llm_used;
    report.llm_failed = stats.llm_failed;
    report.links_created = counts[ViewBuilder::kTotalLinksKey];
    counts.erase(ViewBuilder::kTotalLinksKey);
    report.per_category = std::move(counts);

    if (core_logger) {
        core_logger->info("Categorize finished: {} categorized, {} links, llm calls={} used={} failed={}",
                          report.docs_categorized, report.links_created,
                          report.llm_calls, report.llm_used, report.llm_failed);
    }
    return report;
}
