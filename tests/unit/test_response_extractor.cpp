#include <catch2/catch_test_macros.hpp>

#include "ResponseExtractor.hpp"

#include <json/value.h>

TEST_CASE("ResponseExtractor parses a bare JSON object") {
    const auto value = ResponseExtractor::extract(R"({"category": "Taxes", "confidence": 0.92, "reason": "form 1040"})");
    REQUIRE(value.isObject());
    CHECK(value["category"].asString() == "Taxes");
    CHECK(value["confidence"].asDouble() == 0.92);
    CHECK(value["reason"].asString() == "form 1040");
}

TEST_CASE("ResponseExtractor strips markdown code fences") {
    const std::string fenced = "```json\n{\"category\": \"Travel\", \"confidence\": 0.7}\n```";
    CHECK(ResponseExtractor::strip_code_fences(fenced) == "{\"category\": \"Travel\", \"confidence\": 0.7}");
    CHECK(ResponseExtractor::extract(fenced)["category"].asString() == "Travel");

    const std::string bare_fence = "```\n{\"category\": \"Books\"}```";
    CHECK(ResponseExtractor::extract(bare_fence)["category"].asString() == "Books");
}

TEST_CASE("ResponseExtractor finds an object embedded in prose") {
    const auto value = ResponseExtractor::extract(
        "Sure! Here is my answer: {\"category\": \"Medical\", \"confidence\": 0.8} Hope that helps.");
    CHECK(value["category"].asString() == "Medical");
    CHECK(value["confidence"].asDouble() == 0.8);
}

TEST_CASE("ResponseExtractor prefers the embedded object that names a category") {
    const auto value = ResponseExtractor::extract(
        "Thinking: {\"note\": \"draft\"} Final: {\"category\": \"Legal & Contracts\"}");
    CHECK(value["category"].asString() == "Legal & Contracts");
}

TEST_CASE("ResponseExtractor normalizes typographic quotes") {
    const std::string curly = "{\xE2\x80\x9C" "category\xE2\x80\x9D: \xE2\x80\x9C" "Bank & Finance\xE2\x80\x9D}";
    CHECK(ResponseExtractor::normalize_smart_quotes(curly) == "{\"category\": \"Bank & Finance\"}");
    CHECK(ResponseExtractor::extract(curly)["category"].asString() == "Bank & Finance");
}

TEST_CASE("ResponseExtractor tolerates single-quoted objects") {
    const auto value = ResponseExtractor::extract("{'category': 'Academic Papers', 'confidence': 0.65}");
    CHECK(value["category"].asString() == "Academic Papers");
    CHECK(value["confidence"].asDouble() == 0.65);
}

TEST_CASE("ResponseExtractor falls back to field patterns") {
    const auto value = ResponseExtractor::extract(
        "category: \"Books\", confidence: 0.7, reason: \"long table of contents\"");
    CHECK(value["category"].asString() == "Books");
    CHECK(value["confidence"].asString() == "0.7");
    CHECK(value["reason"].asString() == "long table of contents");
}

TEST_CASE("ResponseExtractor returns an empty object when nothing is recoverable") {
    CHECK(ResponseExtractor::extract("").empty());
    CHECK(ResponseExtractor::extract("   \n ").empty());
    const auto value = ResponseExtractor::extract("I am not sure what this document is.");
    CHECK(value.isObject());
    CHECK(value.empty());
}

TEST_CASE("ResponseExtractor recovers a single-quoted object fenced after prose") {
    const auto value =
        ResponseExtractor::extract("Sure! ```json\n{'category': 'Manuals & Guides', 'confidence': 0.8}\n```");
    REQUIRE(value.isObject());
    CHECK(value["category"].asString() == "Manuals & Guides");
    CHECK(value["confidence"].asDouble() == 0.8);
}
