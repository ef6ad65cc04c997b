#ifndef DATABASE_MANAGER_HPP
#define DATABASE_MANAGER_HPP

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct sqlite3;

enum class DocumentFilter {
    All,
    Uncategorized
};

/**
 * @brief The manifest: Documents keyed by digest and SourceRecords keyed by absolute path,
 * stored in one SQLite file. Every failure to open, migrate or execute a statement
 * raises ManifestError. Mutations are grouped by the caller with a Transaction.
 */
class DatabaseManager {
public:
    explicit DatabaseManager(const std::filesystem::path& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    /**
     * @brief Unit of work. Opens BEGIN IMMEDIATE on construction; rolls back on
     * destruction unless commit() succeeded.
     */
    class Transaction {
    public:
        explicit Transaction(DatabaseManager& manager);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        bool active() const { return active_; }

    private:
        DatabaseManager& manager_;
        bool active_ = false;
    };

    std::optional<SourceRecord> get_source(const std::string& path) const;
    void touch_source_seen(const std::string& path, double seen_at);

    // Insert or update by path; first_seen_at of an existing row is kept.
    void upsert_source(const SourceRecord& record);

    void upsert_document_seen(const std::string& digest,
                              const std::string& store_relative_path,
                              std::int64_t byte_size,
                              double seen_at);

    std::optional<Document> get_document(const std::string& digest) const;
    void update_document_metadata(const std::string& digest, const DocumentMetadata& metadata);
    void update_document_category(const std::string& digest,
                                  const Categorization& result,
                                  double categorized_at);

    // Most recently seen first, digest as tie-break.
    std::vector<Document> get_documents(DocumentFilter filter) const;

    // Latest ok source per digest.
    std::unordered_map<std::string, LatestSource> latest_sources_by_digest() const;

    std::size_t count_documents() const;
    std::size_t count_sources() const;

    const std::filesystem::path& path() const { return db_file; }

private:
    void initialize_schema();
    void exec(const char* sql, const char* what);
    std::size_t count_rows(const char* sql) const;

    sqlite3* db;
    std::filesystem::path db_file;
};

#endif
