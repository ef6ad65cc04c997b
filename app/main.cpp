#include "CategoryConfig.hpp"
#include "ContentStore.hpp"
#include "DatabaseManager.hpp"
#include "Errors.hpp"
#include "FileFinder.hpp"
#include "HttpLLMClient.hpp"
#include "LLMClassifier.hpp"
#include "Library.hpp"
#include "LibraryCatalog.hpp"
#include "LibraryScanner.hpp"
#include "Logger.hpp"
#include "MetadataExtractor.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <CLI/CLI.hpp>
#include <json/json.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kExitConfigError = 2;
constexpr int kExitFailure = 1;

struct CommonOptions {
    std::string library;
    bool verbose = false;
};

struct ScanOptions {
    std::vector<std::string> roots;
    std::vector<std::string> excludes;
    bool dry_run = false;
    int limit = 0;
};

struct CategorizeOptions {
    std::string config;
    std::string link_mode = "symlink";
    bool no_refresh = false;
    bool all = false;
    int text_sample_bytes = 8192;
    std::string llm_provider = "off";
    std::string llm_model;
    std::string llm_mode = "fallback";
    double llm_min_confidence = 0.6;
    double llm_timeout_seconds = 0.0;
    int llm_max_output_tokens = 200;
    std::string llm_path_mode = "tail";
    int llm_path_tail_parts = 3;
};

void add_common_options(CLI::App* sub, CommonOptions& options)
{
    sub->add_option("--library", options.library,
                    "Library root (default: $DOCVAULT_LIBRARY or ~/DocVault)");
    sub->add_flag("-v,--verbose", options.verbose, "Enable debug logging");
}

void add_scan_options(CLI::App* sub, ScanOptions& options)
{
    sub->add_option("--roots", options.roots, "Directories to scan (default: Desktop, Documents, Downloads, home)");
    sub->add_option("--exclude", options.excludes, "Additional path prefixes to skip");
    sub->add_flag("--dry-run", options.dry_run, "Only count discovered PDFs");
    sub->add_option("--limit", options.limit, "Stop after this many discovered files (0 = no limit)")
        ->check(CLI::NonNegativeNumber);
}

void add_categorize_options(CLI::App* sub, CategorizeOptions& options)
{
    sub->add_option("--config", options.config, "Rule set file (default: <library>/categories.json)");
    sub->add_option("--link-mode", options.link_mode, "symlink | hardlink | copy");
    sub->add_flag("--no-refresh", options.no_refresh, "Keep the existing categorized view and add to it");
    sub->add_flag("--all", options.all, "Recategorize every document, not only uncategorized ones");
    sub->add_option("--text-sample-bytes", options.text_sample_bytes, "Bytes of extracted text to sample (0 = none)")
        ->check(CLI::NonNegativeNumber);
    sub->add_option("--llm-provider", options.llm_provider, "off | http");
    sub->add_option("--llm-model", options.llm_model, "Model name (default: $DOCVAULT_LLM_MODEL or qwen3-4b)");
    sub->add_option("--llm-mode", options.llm_mode, "fallback | always");
    sub->add_option("--llm-min-confidence", options.llm_min_confidence, "Minimum confidence to accept an LLM answer")
        ->check(CLI::Range(0.0, 1.0));
    sub->add_option("--llm-timeout-seconds", options.llm_timeout_seconds,
                    "Request timeout (default: $DOCVAULT_LLM_TIMEOUT or 30)")
        ->check(CLI::NonNegativeNumber);
    sub->add_option("--llm-max-output-tokens", options.llm_max_output_tokens, "Completion token budget")
        ->check(CLI::PositiveNumber);
    sub->add_option("--llm-path-mode", options.llm_path_mode, "basename | tail | full");
    sub->add_option("--llm-path-tail-parts", options.llm_path_tail_parts, "Path components shown in tail mode")
        ->check(CLI::PositiveNumber);
}

fs::path resolve_library_root(const CommonOptions& options)
{
    if (!Utils::trim_copy(options.library).empty()) {
        return Utils::resolve_path(Utils::expand_user(options.library));
    }
    return Utils::resolve_path(Library::default_root());
}

std::vector<fs::path> to_paths(const std::vector<std::string>& values)
{
    std::vector<fs::path> paths;
    paths.reserve(values.size());
    for (const auto& value : values) {
        paths.push_back(Utils::resolve_path(Utils::expand_user(value)));
    }
    return paths;
}

ScanSettings build_scan_settings(const ScanOptions& options, const Library& library)
{
    ScanSettings settings;
    settings.roots = options.roots.empty() ? FilesystemWalkFinder::default_roots() : to_paths(options.roots);
    settings.excludes = FilesystemWalkFinder::default_excludes();
    for (const auto& exclude : to_paths(options.excludes)) {
        settings.excludes.push_back(exclude);
    }
    settings.excludes.push_back(library.root());
    settings.excludes = Utils::dedupe_keep_order(settings.excludes);
    settings.dry_run = options.dry_run;
    if (options.limit > 0) {
        settings.limit = static_cast<std::size_t>(options.limit);
    }
    return settings;
}

CategorizeSettings build_categorize_settings(const CategorizeOptions& options)
{
    CategorizeSettings settings;
    if (!Utils::trim_copy(options.config).empty()) {
        settings.config_path = Utils::resolve_path(Utils::expand_user(options.config));
    }
    settings.link_mode = Settings::parse_link_mode(options.link_mode);
    settings.refresh_view = !options.no_refresh;
    settings.recategorize_all = options.all;
    settings.text_sample_bytes = static_cast<std::size_t>(options.text_sample_bytes);

    settings.llm = Settings::llm_from_environment();
    settings.llm.provider = Settings::parse_llm_provider(options.llm_provider);
    if (!Utils::trim_copy(options.llm_model).empty()) {
        settings.llm.model = Utils::trim_copy(options.llm_model);
    }
    settings.llm.mode = Settings::parse_llm_mode(options.llm_mode);
    settings.llm.min_confidence = options.llm_min_confidence;
    if (options.llm_timeout_seconds > 0.0) {
        settings.llm.timeout_seconds = options.llm_timeout_seconds;
    }
    settings.llm.max_output_tokens = options.llm_max_output_tokens;
    settings.llm.path_mode = Settings::parse_path_mode(options.llm_path_mode);
    settings.llm.tail_parts = options.llm_path_tail_parts;

    Settings::validate(settings);
    return settings;
}

Json::Value counters_to_json(const std::map<std::string, int>& counters)
{
    Json::Value out(Json::objectValue);
    for (const auto& [key, value] : counters) {
        out[key] = value;
    }
    return out;
}

void print_json(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << std::endl;
}

ScanStats run_scan(const Library& library, const ScanSettings& settings)
{
    auto core_logger = Logger::get_logger(Logger::kCoreLogger);
    FilesystemWalkFinder finder(settings.roots, settings.excludes, settings.limit);

    if (settings.dry_run) {
        return LibraryScanner::dry_run(finder, core_logger);
    }

    DatabaseManager db_manager(library.db_path());
    ContentStore store(library);
    LibraryScanner scanner(db_manager, store, core_logger);
    return scanner.scan(finder);
}

CatalogReport run_categorize(const Library& library, const CategorizeSettings& settings)
{
    auto core_logger = Logger::get_logger(Logger::kCoreLogger);

    const fs::path config_path = settings.config_path.value_or(library.categories_config_path());
    const RuleSet rules = CategoryConfig::load_file(config_path);

    PopplerMetadataExtractor extractor;

    std::unique_ptr<HttpLLMClient> client;
    std::unique_ptr<LLMClassifier> classifier;
    if (settings.llm.provider == LLMProvider::Http) {
        client = std::make_unique<HttpLLMClient>(settings.llm.base_url, settings.llm.model,
                                                 settings.llm.timeout_seconds);
        LLMClassifierOptions classifier_options;
        classifier_options.path_mode = settings.llm.path_mode;
        classifier_options.tail_parts = settings.llm.tail_parts;
        classifier_options.max_output_tokens = settings.llm.max_output_tokens;
        classifier = std::make_unique<LLMClassifier>(*client, classifier_options);
        if (core_logger) {
            core_logger->info("LLM enabled: {} model={} mode={}", client->endpoint_url(),
                              settings.llm.model, to_string(settings.llm.mode));
        }
    }

    LLMPolicy policy;
    policy.mode = settings.llm.mode;
    policy.min_confidence = settings.llm.min_confidence;

    CatalogOptions options;
    options.link_mode = settings.link_mode;
    options.refresh_view = settings.refresh_view;
    options.recategorize_all = settings.recategorize_all;
    options.text_sample_bytes = settings.text_sample_bytes;

    DatabaseManager db_manager(library.db_path());
    LibraryCatalog catalog(library, db_manager, extractor, core_logger);
    return catalog.categorize(rules, classifier.get(), policy, options);
}

void report_fatal(const char* kind, const std::exception& ex)
{
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->error("{}: {}", kind, ex.what());
    } else {
        std::fprintf(stderr, "%s: %s\n", kind, ex.what());
    }
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{"DocVault: collect PDFs into a content-addressed vault and sort them into categories"};
    app.require_subcommand(1);

    CommonOptions common;
    ScanOptions scan_options;
    CategorizeOptions categorize_options;

    auto* init_cmd = app.add_subcommand("init", "Create the library layout and default rule set");
    add_common_options(init_cmd, common);

    auto* scan_cmd = app.add_subcommand("scan", "Discover PDFs and copy new ones into the vault");
    add_common_options(scan_cmd, common);
    add_scan_options(scan_cmd, scan_options);

    auto* categorize_cmd = app.add_subcommand("categorize", "Categorize documents and rebuild the categorized view");
    add_common_options(categorize_cmd, common);
    add_categorize_options(categorize_cmd, categorize_options);

    auto* run_cmd = app.add_subcommand("run", "Scan, then categorize");
    add_common_options(run_cmd, common);
    add_scan_options(run_cmd, scan_options);
    add_categorize_options(run_cmd, categorize_options);

    CLI11_PARSE(app, argc, argv);

    int exit_code = 0;
    try {
        const Library library(resolve_library_root(common));
        Logger::setup_loggers(library.log_dir(), common.verbose);
        library.ensure_initialized();

        if (init_cmd->parsed()) {
            DatabaseManager db_manager(library.db_path());
            Json::Value out(Json::objectValue);
            out["library"] = library.root().string();
            out["vault"] = library.vault_dir().string();
            out["categorized"] = library.categorized_dir().string();
            out["manifest"] = library.db_path().string();
            out["categories_config"] = library.categories_config_path().string();
            out["documents"] = static_cast<Json::UInt64>(db_manager.count_documents());
            print_json(out);
        } else if (scan_cmd->parsed()) {
            const ScanStats stats = run_scan(library, build_scan_settings(scan_options, library));
            print_json(counters_to_json(stats.as_map()));
        } else if (categorize_cmd->parsed()) {
            const CatalogReport report = run_categorize(library, build_categorize_settings(categorize_options));
            print_json(counters_to_json(report.as_map()));
        } else if (run_cmd->parsed()) {
            const ScanSettings scan_settings = build_scan_settings(scan_options, library);
            const CategorizeSettings categorize_settings = build_categorize_settings(categorize_options);

            Json::Value out(Json::objectValue);
            out["scan"] = counters_to_json(run_scan(library, scan_settings).as_map());
            if (!scan_settings.dry_run) {
                out["categorize"] = counters_to_json(run_categorize(library, categorize_settings).as_map());
            }
            print_json(out);
        }
    } catch (const ConfigError& ex) {
        report_fatal("Configuration error", ex);
        exit_code = kExitConfigError;
    } catch (const std::exception& ex) {
        report_fatal("Fatal error", ex);
        exit_code = kExitFailure;
    }

    Logger::shutdown();
    return exit_code;
}
