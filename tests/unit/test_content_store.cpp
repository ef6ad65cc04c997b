#include <catch2/catch_test_macros.hpp>

#include "CategoryConfig.hpp"
#include "ContentStore.hpp"
#include "Errors.hpp"
#include "Library.hpp"
#include "Sha256Hasher.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr const char* kHelloWorldDigest = "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";

bool scratch_is_empty(const Library& library)
{
    return fs::is_empty(library.tmp_dir());
}

} // namespace

TEST_CASE("Sha256Hasher matches known digests") {
    CHECK(Sha256Hasher::hash("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(Sha256Hasher::hash("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    Sha256Hasher hasher;
    hasher.update("hello ", 6);
    hasher.update("world", 5);
    CHECK(hasher.finalize() == kHelloWorldDigest);

    hasher.update("abc", 3);
    CHECK(hasher.finalize() == Sha256Hasher::hash("abc"));
}

TEST_CASE("Library lays out its directories and default rule set") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();

    CHECK(fs::is_directory(library.vault_dir()));
    CHECK(fs::is_directory(library.categorized_dir()));
    CHECK(fs::is_directory(library.tmp_dir()));
    CHECK(read_file(library.categories_config_path()) == CategoryConfig::default_config_json());

    write_file(library.categories_config_path(), R"({"categories": []})");
    library.ensure_initialized();
    CHECK(read_file(library.categories_config_path()) == R"({"categories": []})");

    CHECK(library.vault_path_for_digest(kHelloWorldDigest) ==
          library.vault_dir() / "b9" / "4d" / (std::string(kHelloWorldDigest) + ".pdf"));
    CHECK(library.relative_to_root(library.vault_path_for_digest(kHelloWorldDigest)) ==
          "vault/b9/4d/" + std::string(kHelloWorldDigest) + ".pdf");
}

TEST_CASE("Library honors DOCVAULT_LIBRARY") {
    EnvVarGuard guard("DOCVAULT_LIBRARY", "/srv/papers");
    CHECK(Library::default_root() == fs::path("/srv/papers"));
}

TEST_CASE("ContentStore copies new content under its digest") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();
    ContentStore store(library);

    const auto source = write_file(dir.path() / "in" / "hello.pdf", "hello world");
    const auto result = store.ingest(source);

    CHECK(result.digest == kHelloWorldDigest);
    CHECK(result.was_new_copy);
    CHECK(result.bytes_written == 11);
    CHECK(result.store_relative_path == "vault/b9/4d/" + std::string(kHelloWorldDigest) + ".pdf");
    CHECK(read_file(library.root() / result.store_relative_path) == "hello world");
    CHECK(store.contains(kHelloWorldDigest));
    CHECK(fs::exists(source));
    CHECK(scratch_is_empty(library));
}

TEST_CASE("ContentStore deduplicates identical content") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();
    ContentStore store(library);

    const auto first = store.ingest(write_file(dir.path() / "a.pdf", "hello world"));
    const auto stored_at = library.root() / first.store_relative_path;
    const auto before = fs::last_write_time(stored_at);

    const auto second = store.ingest(write_file(dir.path() / "elsewhere" / "b.pdf", "hello world"));
    CHECK(second.digest == first.digest);
    CHECK_FALSE(second.was_new_copy);
    CHECK(second.store_relative_path == first.store_relative_path);
    CHECK(fs::last_write_time(stored_at) == before);
    CHECK(scratch_is_empty(library));
}

TEST_CASE("ContentStore keeps different content apart") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();
    ContentStore store(library);

    const auto a = store.ingest(write_file(dir.path() / "a.pdf", "first"));
    const auto b = store.ingest(write_file(dir.path() / "b.pdf", "second"));
    CHECK(a.digest != b.digest);
    CHECK(a.was_new_copy);
    CHECK(b.was_new_copy);
    CHECK(store.contains(a.digest));
    CHECK(store.contains(b.digest));
}

TEST_CASE("ContentStore handles empty files") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();
    ContentStore store(library);

    const auto result = store.ingest(write_file(dir.path() / "empty.pdf", ""));
    CHECK(result.digest == Sha256Hasher::hash(""));
    CHECK(result.bytes_written == 0);
    CHECK(fs::file_size(library.root() / result.store_relative_path) == 0);
}

TEST_CASE("ContentStore reports unreadable sources") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();
    ContentStore store(library);

    CHECK_THROWS_AS(store.ingest(dir.path() / "missing.pdf"), StoreError);
    CHECK_FALSE(store.contains(kHelloWorldDigest));
    CHECK(scratch_is_empty(library));
}

TEST_CASE("ContentStore never replaces a blob stored by a concurrent ingest") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();

    const fs::path destination = library.vault_path_for_digest(kHelloWorldDigest);
    write_file(destination, "hello world");
    const fs::path late = write_file(library.tmp_dir() / "late.tmp", "hello world, second writer");

    CHECK_FALSE(ContentStore::publish(late, destination));
    CHECK(read_file(destination) == "hello world");
    CHECK(fs::exists(late));

    const fs::path fresh = write_file(library.tmp_dir() / "fresh.tmp", "first");
    const fs::path fresh_destination = library.vault_path_for_digest(Sha256Hasher::hash("first"));
    fs::create_directories(fresh_destination.parent_path());
    CHECK(ContentStore::publish(fresh, fresh_destination));
    CHECK(read_file(fresh_destination) == "first");
    CHECK_FALSE(fs::exists(fresh));
}
