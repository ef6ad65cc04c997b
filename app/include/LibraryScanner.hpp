#ifndef LIBRARY_SCANNER_HPP
#define LIBRARY_SCANNER_HPP

#include <map>
#include <memory>
#include <string>

class ContentStore;
class DatabaseManager;
class IFileFinder;
namespace spdlog { class logger; }

struct ScanStats {
    int discovered = 0;
    int skipped_unchanged = 0;
    int copied_new = 0;
    int deduped_existing = 0;
    int errors = 0;

    std::map<std::string, int> as_map() const;
};

/**
 * @brief One scan pass: discovers PDFs, ingests new or changed ones into the store and
 * records every observed path in the manifest. The whole pass is a single transaction.
 *
 * Per-file I/O failures become SourceRecords with status "unreadable" (stat failed)
 * or "error" (copy failed) and the pass continues. Manifest failures abort the pass
 * and roll it back.
 */
class LibraryScanner {
public:
    LibraryScanner(DatabaseManager& db_manager,
                   const ContentStore& store,
                   std::shared_ptr<spdlog::logger> core_logger);

    ScanStats scan(IFileFinder& finder);

    // Counts discoveries only; neither the store nor the manifest is touched.
    static ScanStats dry_run(IFileFinder& finder, const std::shared_ptr<spdlog::logger>& core_logger);

private:
    void process(const std::string& path, double now, ScanStats& stats);

    DatabaseManager& db_manager;
    const ContentStore& store;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
