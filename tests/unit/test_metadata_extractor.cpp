#include <catch2/catch_test_macros.hpp>

#include "MetadataExtractor.hpp"
#include "Utils.hpp"

#include <string>

TEST_CASE("PopplerMetadataExtractor parses pdfinfo output") {
    const std::string output =
        "Title:          Invoice 2025-001\n"
        "Subject:        \n"
        "Author:         ACME Billing\n"
        "Producer:       LibreOffice 7.6\n"
        "CreationDate:   Mon Jan  6 10:15:00 2025 UTC\n"
        "Pages:          3\n"
        "Page size:      595 x 842 pts (A4)\n"
        "garbage line without separator\n";

    const auto metadata = PopplerMetadataExtractor::parse_pdfinfo_output(output);
    CHECK(metadata.title == "Invoice 2025-001");
    CHECK(metadata.authors == "ACME Billing");
    CHECK_FALSE(metadata.subject.has_value());
    CHECK_FALSE(metadata.keywords.has_value());
    CHECK(metadata.page_count == 3);
    CHECK_FALSE(metadata.text_sample.has_value());
    CHECK(metadata.raw_metadata_json ==
          R"({"Author":"ACME Billing","CreationDate":"Mon Jan  6 10:15:00 2025 UTC","Page size":"595 x 842 pts (A4)",)"
          R"("Pages":"3","Producer":"LibreOffice 7.6","Title":"Invoice 2025-001"})");
}

TEST_CASE("PopplerMetadataExtractor ignores unusable page counts") {
    const auto metadata = PopplerMetadataExtractor::parse_pdfinfo_output("Pages: many\n");
    CHECK_FALSE(metadata.page_count.has_value());
    CHECK(metadata.raw_metadata_json.has_value());
    CHECK_FALSE(PopplerMetadataExtractor::parse_pdfinfo_output("").raw_metadata_json.has_value());
    CHECK_FALSE(PopplerMetadataExtractor::parse_pdfinfo_output("Pages: 99999999999\n").page_count.has_value());
    CHECK_FALSE(PopplerMetadataExtractor::parse_pdfinfo_output("Pages: -4\n").page_count.has_value());
}

TEST_CASE("run_with_output_limit captures child stdout") {
    const auto sh = Utils::find_executable("sh");
    REQUIRE(sh.has_value());

    const auto out = run_with_output_limit({sh->string(), "-c", "printf 'Pages: 7'; echo oops >&2"}, 1024);
    CHECK(out.output == "Pages: 7");
    CHECK(out.exited_cleanly);
}

TEST_CASE("run_with_output_limit stops reading at the byte bound") {
    const auto sh = Utils::find_executable("sh");
    REQUIRE(sh.has_value());

    const auto out = run_with_output_limit({sh->string(), "-c", "while :; do echo xxxxxxxxxxxxxxxx; done"}, 100);
    CHECK(out.output.size() == 100);
    CHECK_FALSE(out.exited_cleanly);
}

TEST_CASE("run_with_output_limit reports a failed exec as unclean") {
    const auto out = run_with_output_limit({"/nonexistent/docvault-tool"}, 1024);
    CHECK(out.output.empty());
    CHECK_FALSE(out.exited_cleanly);
}
