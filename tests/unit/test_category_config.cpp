#include <catch2/catch_test_macros.hpp>

#include "CategoryConfig.hpp"
#include "Errors.hpp"
#include "TestHelpers.hpp"

TEST_CASE("CategoryConfig parses every rule field") {
    const auto rules = CategoryConfig::parse(R"({
        "default_category": "Inbox",
        "min_score": 2.5,
        "categories": [
            {
                "name": "Taxes",
                "priority": 10,
                "min_pages": 1,
                "max_pages": 40,
                "path_keywords_any": ["tax"],
                "filename_keywords_any": ["1040", "w2"],
                "metadata_keywords_any": ["internal revenue"],
                "text_keywords_any": ["taxable income"]
            }
        ]
    })");

    CHECK(rules.default_category == "Inbox");
    CHECK(rules.min_score == 2.5);
    REQUIRE(rules.rules.size() == 1);
    const auto& taxes = rules.rules.front();
    CHECK(taxes.name == "Taxes");
    CHECK(taxes.priority == 10.0);
    CHECK(taxes.min_pages == 1);
    CHECK(taxes.max_pages == 40);
    CHECK(taxes.path_keywords == std::vector<std::string>{"tax"});
    CHECK(taxes.filename_keywords == std::vector<std::string>{"1040", "w2"});
    CHECK(taxes.metadata_keywords == std::vector<std::string>{"internal revenue"});
    CHECK(taxes.text_keywords == std::vector<std::string>{"taxable income"});
    CHECK(rules.uses_text());
}

TEST_CASE("CategoryConfig applies defaults for missing keys") {
    const auto rules = CategoryConfig::parse(R"({"categories": [{"name": "Travel"}]})");
    CHECK(rules.default_category == "Unsorted");
    CHECK(rules.min_score == 4.0);
    REQUIRE(rules.rules.size() == 1);
    CHECK(rules.rules.front().priority == 0.0);
    CHECK_FALSE(rules.rules.front().min_pages.has_value());
    CHECK_FALSE(rules.uses_text());
}

TEST_CASE("CategoryConfig skips categories without a name") {
    const auto rules = CategoryConfig::parse(R"({"categories": [{"name": "  "}, {"priority": 3}, {"name": "Books"}]})");
    REQUIRE(rules.rules.size() == 1);
    CHECK(rules.rules.front().name == "Books");
}

TEST_CASE("CategoryConfig rejects malformed documents") {
    CHECK_THROWS_AS(CategoryConfig::parse("{not json"), ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse("[]"), ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse(R"({"default_category": 7})"), ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse(R"({"min_score": "high"})"), ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse(R"({"categories": {}})"), ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse(R"({"categories": ["Taxes"]})"), ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse(R"({"categories": [{"name": "A", "min_pages": 2.5}]})"), ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse(R"({"categories": [{"name": "A", "text_keywords_any": "x"}]})"),
                    ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse(R"({"categories": [{"name": "A", "path_keywords_any": [1]}]})"),
                    ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse(R"({"categories": [{"name": "Books", "min_pages": 10000000000}]})"),
                    ConfigError);
    CHECK_THROWS_AS(CategoryConfig::parse(R"({"categories": [{"name": "Books", "max_pages": -10000000000}]})"),
                    ConfigError);
}

TEST_CASE("CategoryConfig default rule set loads from disk") {
    TempDir dir;
    const auto path = write_file(dir.path() / "categories.json", CategoryConfig::default_config_json());

    const auto rules = CategoryConfig::load_file(path);
    CHECK(rules.default_category == "Unsorted");
    CHECK(rules.min_score == 4.0);
    const auto names = rules.category_names();
    REQUIRE(names.size() == 9);
    CHECK(names.front() == "Receipts & Invoices");
    CHECK(names.back() == "Books");
    CHECK(rules.uses_text());
}

TEST_CASE("CategoryConfig reports a missing file as a configuration error") {
    TempDir dir;
    CHECK_THROWS_AS(CategoryConfig::load_file(dir.path() / "absent.json"), ConfigError);
}
