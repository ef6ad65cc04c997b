#include "DatabaseManager.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <cstdio>
#include <memory>
#include <utility>

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

template <typename... Args>
void db_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger(Logger::kDbLogger)) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

StatementPtr prepare_statement(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        const std::string message = fmt::format("SQL prepare error: {}", sqlite3_errmsg(db));
        db_log(spdlog::level::err, "{}", message);
        throw ManifestError(message);
    }
    return StatementPtr(raw);
}

void step_done(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        const std::string message = fmt::format("SQL error during {}: {}", what, sqlite3_errmsg(db));
        db_log(spdlog::level::err, "{}", message);
        throw ManifestError(message);
    }
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
    return std::string(text ? text : "");
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    return column_optional_text(stmt, index).value_or(std::string());
}

std::optional<double> column_optional_double(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, index);
}

std::optional<std::int64_t> column_optional_int64(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
}

constexpr const char* kDocumentColumns =
    "hash, vault_relpath, file_size, first_seen_at, last_seen_at, page_count, title, authors, "
    "subject, keywords, text_sample, meta_json, category, category_score, category_reason, "
    "categorized_at";

Document build_document(sqlite3_stmt* stmt) {
    Document doc;
    doc.digest = column_text(stmt, 0);
    doc.store_relative_path = column_text(stmt, 1);
    doc.byte_size = column_optional_int64(stmt, 2).value_or(0);
    doc.first_seen_at = column_optional_double(stmt, 3).value_or(0.0);
    doc.last_seen_at = column_optional_double(stmt, 4).value_or(0.0);
    if (auto pages = column_optional_int64(stmt, 5)) {
        doc.metadata.page_count = static_cast<int>(*pages);
    }
    doc.metadata.title = column_optional_text(stmt, 6);
    doc.metadata.authors = column_optional_text(stmt, 7);
    doc.metadata.subject = column_optional_text(stmt, 8);
    doc.metadata.keywords = column_optional_text(stmt, 9);
    doc.metadata.text_sample = column_optional_text(stmt, 10);
    doc.metadata.raw_metadata_json = column_optional_text(stmt, 11);
    doc.category = column_optional_text(stmt, 12);
    doc.category_score = column_optional_double(stmt, 13);
    doc.category_reason = column_optional_text(stmt, 14);
    doc.categorized_at = column_optional_double(stmt, 15);
    return doc;
}

} // namespace

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path)
    : db(nullptr),
      db_file(db_path) {
    if (db_file.empty()) {
        throw ManifestError("Database path is empty");
    }

    if (sqlite3_open(db_file.c_str(), &db) != SQLITE_OK) {
        const std::string message = fmt::format("Can't open database {}: {}", db_file.string(),
                                                db ? sqlite3_errmsg(db) : "out of memory");
        db_log(spdlog::level::err, "{}", message);
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        throw ManifestError(message);
    }

    sqlite3_extended_result_codes(db, 1);
    sqlite3_busy_timeout(db, 5000);

    try {
        initialize_schema();
    } catch (const ManifestError&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

DatabaseManager::~DatabaseManager() {
    if (db) {
        sqlite3_close(db);
        db = nullptr;
    }
}

void DatabaseManager::exec(const char* sql, const char* what) {
    char* error_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
        const std::string message = fmt::format("Failed to {}: {}", what, error_msg ? error_msg : sqlite3_errmsg(db));
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        db_log(spdlog::level::err, "{}", message);
        throw ManifestError(message);
    }
}

void DatabaseManager::initialize_schema() {
    exec("PRAGMA foreign_keys = ON;", "enable foreign keys");
    exec("PRAGMA journal_mode = WAL;", "enable WAL journal");

    exec(R"(
        CREATE TABLE IF NOT EXISTS documents (
            hash TEXT PRIMARY KEY,
            vault_relpath TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            first_seen_at REAL NOT NULL,
            last_seen_at REAL NOT NULL,
            page_count INTEGER,
            title TEXT,
            authors TEXT,
            subject TEXT,
            keywords TEXT,
            text_sample TEXT,
            meta_json TEXT,
            category TEXT,
            category_score REAL,
            category_reason TEXT,
            categorized_at REAL
        );
    )", "create documents table");

    exec(R"(
        CREATE TABLE IF NOT EXISTS source_files (
            source_path TEXT PRIMARY KEY,
            source_basename TEXT NOT NULL,
            source_size INTEGER,
            source_mtime REAL,
            hash TEXT,
            first_seen_at REAL NOT NULL,
            last_seen_at REAL NOT NULL,
            status TEXT NOT NULL,
            error TEXT,
            FOREIGN KEY(hash) REFERENCES documents(hash)
        );
    )", "create source_files table");

    exec("CREATE INDEX IF NOT EXISTS idx_source_hash ON source_files(hash);",
         "create source hash index");
    exec("CREATE INDEX IF NOT EXISTS idx_documents_category ON documents(category);",
         "create category index");
}

DatabaseManager::Transaction::Transaction(DatabaseManager& manager)
    : manager_(manager) {
    manager_.exec("BEGIN IMMEDIATE;", "begin transaction");
    active_ = true;
}

DatabaseManager::Transaction::~Transaction() {
    if (!active_) {
        return;
    }
    char* error_msg = nullptr;
    if (sqlite3_exec(manager_.db, "ROLLBACK;", nullptr, nullptr, &error_msg) != SQLITE_OK) {
        db_log(spdlog::level::err, "Failed to roll back transaction: {}", error_msg ? error_msg : "");
    } else {
        db_log(spdlog::level::warn, "Rolled back uncommitted manifest changes");
    }
    if (error_msg) {
        sqlite3_free(error_msg);
    }
}

void DatabaseManager::Transaction::commit() {
    if (!active_) {
        return;
    }
    manager_.exec("COMMIT;", "commit transaction");
    active_ = false;
}

std::optional<SourceRecord> DatabaseManager::get_source(const std::string& path) const {
    const char* sql = R"(
        SELECT source_path, source_basename, source_size, source_mtime, hash,
               first_seen_at, last_seen_at, status, error
        FROM source_files WHERE source_path = ?;
    )";
    auto stmt = prepare_statement(db, sql);
    bind_text(stmt.get(), 1, path);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw ManifestError(fmt::format("SQL error reading source '{}': {}", path, sqlite3_errmsg(db)));
    }

    SourceRecord record;
    record.path = column_text(stmt.get(), 0);
    record.basename = column_text(stmt.get(), 1);
    record.size = column_optional_int64(stmt.get(), 2);
    record.modified_time = column_optional_double(stmt.get(), 3);
    record.digest = column_optional_text(stmt.get(), 4);
    record.first_seen_at = column_optional_double(stmt.get(), 5).value_or(0.0);
    record.last_seen_at = column_optional_double(stmt.get(), 6).value_or(0.0);
    const std::string status = column_text(stmt.get(), 7);
    record.status = source_status_from_string(status).value_or(SourceStatus::Error);
    record.error = column_optional_text(stmt.get(), 8);
    return record;
}

void DatabaseManager::touch_source_seen(const std::string& path, double seen_at) {
    auto stmt = prepare_statement(db, "UPDATE source_files SET last_seen_at = ? WHERE source_path = ?;");
    sqlite3_bind_double(stmt.get(), 1, seen_at);
    bind_text(stmt.get(), 2, path);
    step_done(db, stmt.get(), "touch source");
}

void DatabaseManager::upsert_source(const SourceRecord& record) {
    const char* sql = R"(
        INSERT INTO source_files
            (source_path, source_basename, source_size, source_mtime, hash,
             first_seen_at, last_seen_at, status, error)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(source_path)
        DO UPDATE SET
            source_basename = excluded.source_basename,
            source_size = excluded.source_size,
            source_mtime = excluded.source_mtime,
            hash = excluded.hash,
            last_seen_at = excluded.last_seen_at,
            status = excluded.status,
            error = excluded.error;
    )";
    auto stmt = prepare_statement(db, sql);
    bind_text(stmt.get(), 1, record.path);
    bind_text(stmt.get(), 2, record.basename);
    if (record.size) {
        sqlite3_bind_int64(stmt.get(), 3, *record.size);
    } else {
        sqlite3_bind_null(stmt.get(), 3);
    }
    if (record.modified_time) {
        sqlite3_bind_double(stmt.get(), 4, *record.modified_time);
    } else {
        sqlite3_bind_null(stmt.get(), 4);
    }
    bind_optional_text(stmt.get(), 5, record.digest);
    sqlite3_bind_double(stmt.get(), 6, record.first_seen_at);
    sqlite3_bind_double(stmt.get(), 7, record.last_seen_at);
    bind_text(stmt.get(), 8, to_string(record.status));
    bind_optional_text(stmt.get(), 9, record.error);
    step_done(db, stmt.get(), "source upsert");
}

void DatabaseManager::upsert_document_seen(const std::string& digest,
                                           const std::string& store_relative_path,
                                           std::int64_t byte_size,
                                           double seen_at) {
    const char* sql = R"(
        INSERT INTO documents (hash, vault_relpath, file_size, first_seen_at, last_seen_at)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(hash)
        DO UPDATE SET
            vault_relpath = excluded.vault_relpath,
            file_size = excluded.file_size,
            last_seen_at = excluded.last_seen_at;
    )";
    auto stmt = prepare_statement(db, sql);
    bind_text(stmt.get(), 1, digest);
    bind_text(stmt.get(), 2, store_relative_path);
    sqlite3_bind_int64(stmt.get(), 3, byte_size);
    sqlite3_bind_double(stmt.get(), 4, seen_at);
    sqlite3_bind_double(stmt.get(), 5, seen_at);
    step_done(db, stmt.get(), "document upsert");
}

std::optional<Document> DatabaseManager::get_document(const std::string& digest) const {
    const std::string sql = fmt::format("SELECT {} FROM documents WHERE hash = ?;", kDocumentColumns);
    auto stmt = prepare_statement(db, sql.c_str());
    bind_text(stmt.get(), 1, digest);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw ManifestError(fmt::format("SQL error reading document {}: {}", digest, sqlite3_errmsg(db)));
    }
    return build_document(stmt.get());
}

void DatabaseManager::update_document_metadata(const std::string& digest, const DocumentMetadata& metadata) {
    const char* sql = R"(
        UPDATE documents SET
            page_count = ?, title = ?, authors = ?, subject = ?, keywords = ?,
            text_sample = ?, meta_json = ?
        WHERE hash = ?;
    )";
    auto stmt = prepare_statement(db, sql);
    if (metadata.page_count) {
        sqlite3_bind_int(stmt.get(), 1, *metadata.page_count);
    } else {
        sqlite3_bind_null(stmt.get(), 1);
    }
    bind_optional_text(stmt.get(), 2, metadata.title);
    bind_optional_text(stmt.get(), 3, metadata.authors);
    bind_optional_text(stmt.get(), 4, metadata.subject);
    bind_optional_text(stmt.get(), 5, metadata.keywords);
    bind_optional_text(stmt.get(), 6, metadata.text_sample);
    bind_optional_text(stmt.get(), 7, metadata.raw_metadata_json);
    bind_text(stmt.get(), 8, digest);
    step_done(db, stmt.get(), "metadata update");
}

void DatabaseManager::update_document_category(const std::string& digest,
                                               const Categorization& result,
                                               double categorized_at) {
    const char* sql = R"(
        UPDATE documents SET
            category = ?, category_score = ?, category_reason = ?, categorized_at = ?
        WHERE hash = ?;
    )";
    auto stmt = prepare_statement(db, sql);
    bind_text(stmt.get(), 1, result.category);
    sqlite3_bind_double(stmt.get(), 2, result.score);
    bind_text(stmt.get(), 3, result.reason);
    sqlite3_bind_double(stmt.get(), 4, categorized_at);
    bind_text(stmt.get(), 5, digest);
    step_done(db, stmt.get(), "category update");
}

std::vector<Document> DatabaseManager::get_documents(DocumentFilter filter) const {
    const char* where = filter == DocumentFilter::Uncategorized ? "WHERE category IS NULL OR category = '' " : "";
    const std::string sql = fmt::format("SELECT {} FROM documents {}ORDER BY last_seen_at DESC, hash ASC;",
                                        kDocumentColumns, where);
    auto stmt = prepare_statement(db, sql.c_str());

    std::vector<Document> documents;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        documents.push_back(build_document(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw ManifestError(fmt::format("SQL error listing documents: {}", sqlite3_errmsg(db)));
    }
    return documents;
}

std::unordered_map<std::string, LatestSource> DatabaseManager::latest_sources_by_digest() const {
    const char* sql = R"(
        SELECT hash, source_path, source_basename
        FROM source_files
        WHERE status = 'ok' AND hash IS NOT NULL
        ORDER BY last_seen_at DESC, source_path ASC;
    )";
    auto stmt = prepare_statement(db, sql);

    std::unordered_map<std::string, LatestSource> latest;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        std::string digest = column_text(stmt.get(), 0);
        // Rows arrive newest first; keep the first one per digest.
        latest.try_emplace(std::move(digest), LatestSource{column_text(stmt.get(), 1), column_text(stmt.get(), 2)});
    }
    if (rc != SQLITE_DONE) {
        throw ManifestError(fmt::format("SQL error listing sources: {}", sqlite3_errmsg(db)));
    }
    return latest;
}

std::size_t DatabaseManager::count_rows(const char* sql) const {
    auto stmt = prepare_statement(db, sql);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw ManifestError(fmt::format("SQL error counting rows: {}", sqlite3_errmsg(db)));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::size_t DatabaseManager::count_documents() const {
    return count_rows("SELECT COUNT(*) FROM documents;");
}

std::size_t DatabaseManager::count_sources() const {
    return count_rows("SELECT COUNT(*) FROM source_files;");
}
