#include <catch2/catch_test_macros.hpp>

#include "ContentStore.hpp"
#include "DatabaseManager.hpp"
#include "FileFinder.hpp"
#include "Library.hpp"
#include "LibraryScanner.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

class ListFinder : public IFileFinder {
public:
    explicit ListFinder(std::vector<fs::path> paths) : paths(std::move(paths)) {}

    void for_each(const Visitor& visitor) override
    {
        for (const auto& path : paths) {
            visitor(path);
        }
    }

private:
    std::vector<fs::path> paths;
};

ino_t inode_of(const fs::path& path)
{
    struct stat st {};
    REQUIRE(::stat(path.c_str(), &st) == 0);
    return st.st_ino;
}

std::vector<std::string> discovered_names(IFileFinder& finder)
{
    std::vector<std::string> names;
    finder.for_each([&names](const fs::path& path) { names.push_back(path.filename().string()); });
    std::sort(names.begin(), names.end());
    return names;
}

struct ScanFixture {
    ScanFixture()
        : library(dir.path() / "DocVault"),
          inbox(dir.path() / "inbox")
    {
        library.ensure_initialized();
        write_file(inbox / "a.pdf", "same bytes");
        write_file(inbox / "nested" / "b.PDF", "same bytes");
        write_file(inbox / "nested" / "deeper" / "c.pdf", "unique bytes");
        write_file(inbox / "notes.txt", "not a pdf");
    }

    FilesystemWalkFinder finder() const
    {
        return FilesystemWalkFinder({inbox, dir.path()}, {library.root()}, std::nullopt);
    }

    TempDir dir;
    Library library;
    fs::path inbox;
};

} // namespace

TEST_CASE("FilesystemWalkFinder reports PDFs once and prunes excluded directories") {
    TempDir dir;
    write_file(dir.path() / "one.pdf", "1");
    write_file(dir.path() / "Two.PDF", "2");
    write_file(dir.path() / "readme.md", "x");
    write_file(dir.path() / "sub" / "three.pdf", "3");
    write_file(dir.path() / "skip" / "four.pdf", "4");
    fs::create_directories(dir.path() / "folder.pdf");

    FilesystemWalkFinder finder({dir.path(), dir.path() / "sub"}, {dir.path() / "skip"}, std::nullopt);
    CHECK(discovered_names(finder) == std::vector<std::string>{"Two.PDF", "one.pdf", "three.pdf"});
}

TEST_CASE("FilesystemWalkFinder stops at the limit and ignores missing roots") {
    TempDir dir;
    for (int i = 0; i < 5; ++i) {
        write_file(dir.path() / ("doc" + std::to_string(i) + ".pdf"), "x");
    }

    FilesystemWalkFinder limited({dir.path() / "absent", dir.path()}, {}, 2);
    CHECK(discovered_names(limited).size() == 2);
}

TEST_CASE("FilesystemWalkFinder default excludes cover system directories") {
    const auto excludes = FilesystemWalkFinder::default_excludes();
    CHECK(std::find(excludes.begin(), excludes.end(), fs::path("/proc")) != excludes.end());
    CHECK(std::find(excludes.begin(), excludes.end(), fs::path("/usr")) != excludes.end());
}

TEST_CASE("LibraryScanner copies new content and deduplicates repeats") {
    ScanFixture fixture;
    DatabaseManager db(fixture.library.db_path());
    ContentStore store(fixture.library);
    LibraryScanner scanner(db, store, nullptr);

    auto finder = fixture.finder();
    const auto stats = scanner.scan(finder);
    CHECK(stats.discovered == 3);
    CHECK(stats.copied_new == 2);
    CHECK(stats.deduped_existing == 1);
    CHECK(stats.skipped_unchanged == 0);
    CHECK(stats.errors == 0);
    CHECK(db.count_documents() == 2);
    CHECK(db.count_sources() == 3);

    const auto source = db.get_source(fs::path(fixture.inbox / "a.pdf").string());
    REQUIRE(source.has_value());
    CHECK(source->status == SourceStatus::Ok);
    CHECK(source->basename == "a.pdf");
    CHECK(source->size == 10);
    REQUIRE(source->digest.has_value());
    CHECK(store.contains(*source->digest));
    CHECK(source->digest == db.get_source(fs::path(fixture.inbox / "nested" / "b.PDF").string())->digest);
}

TEST_CASE("LibraryScanner skips unchanged files and picks up modified ones") {
    ScanFixture fixture;
    DatabaseManager db(fixture.library.db_path());
    ContentStore store(fixture.library);
    LibraryScanner scanner(db, store, nullptr);

    auto finder = fixture.finder();
    scanner.scan(finder);

    const std::string unchanged_path = fs::path(fixture.inbox / "nested" / "deeper" / "c.pdf").string();
    const auto first_seen = db.get_source(unchanged_path);
    REQUIRE(first_seen.has_value());
    REQUIRE(first_seen->digest.has_value());
    const fs::path blob = fixture.library.vault_path_for_digest(*first_seen->digest);
    const auto blob_inode = inode_of(blob);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    const auto again = scanner.scan(finder);
    CHECK(again.discovered == 3);
    CHECK(again.skipped_unchanged == 3);
    CHECK(again.copied_new == 0);
    CHECK(again.deduped_existing == 0);
    CHECK(again.errors == 0);
    CHECK(db.count_documents() == 2);
    CHECK(inode_of(blob) == blob_inode);

    const auto seen_again = db.get_source(unchanged_path);
    REQUIRE(seen_again.has_value());
    CHECK(seen_again->last_seen_at > first_seen->last_seen_at);
    CHECK(seen_again->first_seen_at == first_seen->first_seen_at);

    const fs::path changed = fixture.inbox / "a.pdf";
    write_file(changed, "edited bytes");
    fs::last_write_time(changed, fs::last_write_time(changed) + std::chrono::seconds(5));

    const auto third = scanner.scan(finder);
    CHECK(third.skipped_unchanged == 2);
    CHECK(third.copied_new == 1);
    CHECK(db.count_documents() == 3);
    CHECK(db.count_sources() == 3);
}

TEST_CASE("LibraryScanner records unreadable paths and keeps going") {
    ScanFixture fixture;
    DatabaseManager db(fixture.library.db_path());
    ContentStore store(fixture.library);
    LibraryScanner scanner(db, store, nullptr);

    const fs::path missing = fixture.inbox / "vanished.pdf";
    ListFinder finder({missing, fixture.inbox / "a.pdf"});
    const auto stats = scanner.scan(finder);

    CHECK(stats.discovered == 2);
    CHECK(stats.errors == 1);
    CHECK(stats.copied_new == 1);

    const auto record = db.get_source(missing.string());
    REQUIRE(record.has_value());
    CHECK(record->status == SourceStatus::Unreadable);
    CHECK(record->error.has_value());
    CHECK_FALSE(record->digest.has_value());
}

TEST_CASE("LibraryScanner dry run only counts") {
    ScanFixture fixture;
    auto finder = fixture.finder();

    const auto stats = LibraryScanner::dry_run(finder, nullptr);
    CHECK(stats.discovered == 3);
    CHECK(stats.copied_new == 0);
    CHECK(fs::is_empty(fixture.library.vault_dir()));
    CHECK_FALSE(fs::exists(fixture.library.db_path()));
}

TEST_CASE("ScanStats exposes every counter by name") {
    ScanStats stats;
    stats.discovered = 4;
    stats.errors = 1;
    const auto counters = stats.as_map();
    CHECK(counters.size() == 5);
    CHECK(counters.at("discovered") == 4);
    CHECK(counters.at("errors") == 1);
    CHECK(counters.at("deduped_existing") == 0);
}
