#include "LibraryScanner.hpp"

#include "ContentStore.hpp"
#include "DatabaseManager.hpp"
#include "Errors.hpp"
#include "FileFinder.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <sys/stat.h>

std::map<std::string, int> ScanStats::as_map() const
{
    return {
        {"discovered", discovered},
        {"skipped_unchanged", skipped_unchanged},
        {"copied_new", copied_new},
        {"deduped_existing", deduped_existing},
        {"errors", errors},
    };
}

LibraryScanner::LibraryScanner(DatabaseManager& db_manager,
                               const ContentStore& store,
                               std::shared_ptr<spdlog::logger> core_logger)
    : db_manager(db_manager),
      store(store),
      core_logger(std::move(core_logger)) {}

ScanStats LibraryScanner::dry_run(IFileFinder& finder, const std::shared_ptr<spdlog::logger>& core_logger)
{
    ScanStats stats;
    finder.for_each([&](const std::filesystem::path& path) {
        ++stats.discovered;
        if (core_logger) {
            core_logger->info("[dry-run] would copy: {}", path.string());
        }
    });
    return stats;
}

ScanStats LibraryScanner::scan(IFileFinder& finder)
{
    ScanStats stats;
    const double now = Utils::now_ts();

    DatabaseManager::Transaction transaction(db_manager);
    finder.for_each([&](const std::filesystem::path& path) {
        ++stats.discovered;
        process(path.string(), now, stats);
    });
    transaction.commit();

    if (core_logger) {
        core_logger->info("Scan finished: discovered={} unchanged={} new={} deduped={} errors={}",
                          stats.discovered, stats.skipped_unchanged, stats.copied_new,
                          stats.deduped_existing, stats.errors);
    }
    return stats;
}

void LibraryScanner::process(const std::string& path, double now, ScanStats& stats)
{
    SourceRecord record;
    record.path = path;
    record.basename = std::filesystem::path(path).filename().string();
    record.first_seen_at = now;
    record.last_seen_at = now;

    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        ++stats.errors;
        record.status = SourceStatus::Unreadable;
        record.error = std::strerror(errno);
        if (core_logger) {
            core_logger->warn("Cannot stat {}: {}", path, *record.error);
        }
        db_manager.upsert_source(record);
        return;
    }
    record.size = static_cast<std::int64_t>(st.st_size);
    record.modified_time = static_cast<double>(st.st_mtim.tv_sec) +
                           static_cast<double>(st.st_mtim.tv_nsec) / 1e9;

    const auto existing = db_manager.get_source(path);
    if (existing && existing->status == SourceStatus::Ok &&
        existing->size == record.size && existing->modified_time == record.modified_time) {
        ++stats.skipped_unchanged;
        db_manager.touch_source_seen(path, now);
        return;
    }

    IngestResult ingested;
    try {
        ingested = store.ingest(path);
    } catch (const StoreError& ex) {
        ++stats.errors;
        record.status = SourceStatus::Error;
        record.error = ex.what();
        if (core_logger) {
            core_logger->warn("Failed to store {}: {}", path, ex.what());
        }
        db_manager.upsert_source(record);
        return;
    }

    db_manager.upsert_document_seen(ingested.digest, ingested.store_relative_path, ingested.bytes_written, now);

    record.digest = ingested.digest;
    record.status = SourceStatus::Ok;
    db_manager.upsert_source(record);

    if (ingested.was_new_copy) {
        ++stats.copied_new;
    } else {
        ++stats.deduped_existing;
    }
    if (core_logger) {
        core_logger->debug("{} {} -> {}", ingested.was_new_copy ? "copied" : "deduped",
                           path, ingested.digest.substr(0, 12));
    }
}
