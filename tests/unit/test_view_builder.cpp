#include <catch2/catch_test_macros.hpp>

#include "Library.hpp"
#include "TestHelpers.hpp"
#include "ViewBuilder.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

Document stored_document(const Library& library,
                         const std::string& digest,
                         std::optional<std::string> category,
                         const std::string& content)
{
    Document doc;
    doc.digest = digest;
    doc.store_relative_path = library.relative_to_root(library.vault_path_for_digest(digest));
    doc.category = std::move(category);
    write_file(library.root() / doc.store_relative_path, content);
    return doc;
}

ViewBuilder::NameResolver title_or(const std::string& fallback)
{
    return [fallback](const Document& doc) { return doc.metadata.title.value_or(fallback); };
}

std::vector<std::string> entries_in(const fs::path& dir)
{
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

TEST_CASE("ViewBuilder derives link stems from display names") {
    CHECK(ViewBuilder::link_stem("Invoice 2025.PDF") == "Invoice 2025");
    CHECK(ViewBuilder::link_stem("Q3 report: final/v2") == "Q3 report_ final_v2");
    CHECK(ViewBuilder::link_stem("   ") == "untitled");
}

TEST_CASE("ViewBuilder links documents into category folders with relative symlinks") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();

    const std::string digest_a = "1111111122222222" + std::string(48, 'a');
    const std::string digest_b = "3333333344444444" + std::string(48, 'b');
    auto invoice = stored_document(library, digest_a, "Receipts & Invoices", "invoice bytes");
    invoice.metadata.title = "Invoice 2025";
    const auto unsorted = stored_document(library, digest_b, std::nullopt, "other bytes");

    ViewBuilder view(library);
    const auto counts = view.rebuild({invoice, unsorted}, LinkMode::Symlink, title_or("scan"), true, "Unsorted");

    CHECK(counts.at(ViewBuilder::kTotalLinksKey) == 2);
    CHECK(counts.at("Receipts & Invoices") == 1);
    CHECK(counts.at("Unsorted") == 1);

    const fs::path link = library.categorized_dir() / "Receipts _ Invoices" / "Invoice 2025__11111111.pdf";
    REQUIRE(fs::is_symlink(link));
    CHECK(fs::read_symlink(link).is_relative());
    CHECK(read_file(link) == "invoice bytes");

    CHECK(entries_in(library.categorized_dir() / "Unsorted") == std::vector<std::string>{"scan__33333333.pdf"});
}

TEST_CASE("ViewBuilder disambiguates colliding names") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();

    const std::string prefix = "abcdef01";
    const auto first = stored_document(library, prefix + std::string(56, '1'), "Books", "one");
    const auto second = stored_document(library, prefix + std::string(56, '2'), "Books", "two");
    const auto third = stored_document(library, prefix + std::string(56, '3'), "Books", "three");

    ViewBuilder view(library);
    view.rebuild({first, second, third}, LinkMode::Symlink, title_or("Manual"), true, "Unsorted");

    CHECK(entries_in(library.categorized_dir() / "Books") ==
          std::vector<std::string>{"Manual__abcdef01.pdf", "Manual__abcdef01__2.pdf", "Manual__abcdef01__3.pdf"});
    CHECK(read_file(library.categorized_dir() / "Books" / "Manual__abcdef01__2.pdf") == "two");
}

TEST_CASE("ViewBuilder rebuilds an identical tree from identical input") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();

    const std::string prefix = "abcdef01";
    auto first = stored_document(library, prefix + std::string(56, '1'), "Books", "one");
    first.metadata.title = "Same Name";
    auto second = stored_document(library, prefix + std::string(56, '2'), "Books", "two");
    second.metadata.title = "Same Name";
    const auto unsorted = stored_document(library, std::string(64, 'e'), std::nullopt, "three");

    auto snapshot = [&library]() {
        std::vector<std::string> lines;
        for (const auto& entry : fs::recursive_directory_iterator(library.categorized_dir())) {
            std::string line = fs::relative(entry.path(), library.categorized_dir()).string();
            if (fs::is_symlink(entry.symlink_status())) {
                line += " -> " + fs::read_symlink(entry.path()).string();
            }
            lines.push_back(line);
        }
        std::sort(lines.begin(), lines.end());
        return lines;
    };

    ViewBuilder view(library);
    view.rebuild({first, second, unsorted}, LinkMode::Symlink, title_or("scan"), true, "Unsorted");
    const auto before = snapshot();
    view.rebuild({first, second, unsorted}, LinkMode::Symlink, title_or("scan"), true, "Unsorted");

    CHECK(snapshot() == before);
    CHECK(entries_in(library.categorized_dir() / "Books") ==
          std::vector<std::string>{"Same Name__abcdef01.pdf", "Same Name__abcdef01__2.pdf"});
}

TEST_CASE("ViewBuilder refresh clears stale entries") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();
    const auto doc = stored_document(library, std::string(64, 'c'), "Travel", "ticket");
    write_file(library.categorized_dir() / "Old" / "stale.pdf", "stale");

    ViewBuilder view(library);

    SECTION("refresh removes entries that no longer correspond to a document") {
        view.rebuild({doc}, LinkMode::Symlink, title_or("Ticket"), true, "Unsorted");
        CHECK_FALSE(fs::exists(library.categorized_dir() / "Old"));
        CHECK(entries_in(library.categorized_dir()) == std::vector<std::string>{"Travel"});
    }

    SECTION("without refresh existing entries stay and new ones avoid them") {
        view.rebuild({doc}, LinkMode::Symlink, title_or("Ticket"), true, "Unsorted");
        view.rebuild({doc}, LinkMode::Symlink, title_or("Ticket"), false, "Unsorted");
        CHECK(fs::exists(library.categorized_dir() / "Travel" / "Ticket__cccccccc.pdf"));
        CHECK(fs::exists(library.categorized_dir() / "Travel" / "Ticket__cccccccc__2.pdf"));
    }
}

TEST_CASE("ViewBuilder hard links share the vault inode") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();
    const auto doc = stored_document(library, std::string(64, 'd'), "Medical", "lab results");

    ViewBuilder view(library);
    view.rebuild({doc}, LinkMode::Hardlink, title_or("Lab"), true, "Unsorted");

    const fs::path link = library.categorized_dir() / "Medical" / "Lab__dddddddd.pdf";
    REQUIRE(fs::exists(link));
    CHECK_FALSE(fs::is_symlink(link));
    CHECK(fs::equivalent(link, library.root() / doc.store_relative_path));
    CHECK(fs::hard_link_count(link) == 2);
}

TEST_CASE("ViewBuilder copies are independent files") {
    TempDir dir;
    const Library library(dir.path() / "lib");
    library.ensure_initialized();
    const auto doc = stored_document(library, std::string(64, 'e'), "Legal & Contracts", "lease");

    ViewBuilder view(library);
    view.rebuild({doc}, LinkMode::Copy, title_or("Lease"), true, "Unsorted");

    const fs::path copy = library.categorized_dir() / "Legal _ Contracts" / "Lease__eeeeeeee.pdf";
    REQUIRE(fs::is_regular_file(fs::symlink_status(copy)));
    CHECK(read_file(copy) == "lease");
    CHECK_FALSE(fs::equivalent(copy, library.root() / doc.store_relative_path));
}
