#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "HttpLLMClient.hpp"
#include "LLMErrors.hpp"

#include <json/json.h>

#include <memory>
#include <string>

using Catch::Matchers::ContainsSubstring;

namespace {

Json::Value parse_json(const std::string& text)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    REQUIRE(reader->parse(text.data(), text.data() + text.size(), &root, &errors));
    return root;
}

constexpr const char* kUrl = "http://localhost:8000/chat/completions";

} // namespace

TEST_CASE("HttpLLMClient targets the chat completions endpoint") {
    CHECK(HttpLLMClient("http://localhost:8000", "qwen3-4b", 30).endpoint_url() == kUrl);
    CHECK(HttpLLMClient(" http://localhost:8000/// ", "qwen3-4b", 30).endpoint_url() == kUrl);
    CHECK(HttpLLMClient("http://gpu-box:9000/v1", "", 30).endpoint_url() == "http://gpu-box:9000/v1/chat/completions");

    HttpLLMClient client("http://localhost:8000", "qwen3-4b", 30);
    CHECK(client.provider_name() == "http");
    CHECK(client.model_name() == "qwen3-4b");
}

TEST_CASE("HttpLLMClient request body is OpenAI compatible") {
    const auto body = parse_json(HttpLLMClient::build_request_body("Classify this", "qwen3-4b", 200));
    REQUIRE(body["messages"].isArray());
    REQUIRE(body["messages"].size() == 1);
    CHECK(body["messages"][0]["role"].asString() == "user");
    CHECK(body["messages"][0]["content"].asString() == "Classify this");
    CHECK(body["max_completion_tokens"].asInt() == 200);
    CHECK(body["temperature"].asDouble() == 0.0);
    CHECK(body["stream"].asBool() == false);
    CHECK(body["model"].asString() == "qwen3-4b");

    const auto without_model = parse_json(HttpLLMClient::build_request_body("x", "", 10));
    CHECK_FALSE(without_model.isMember("model"));
}

TEST_CASE("HttpLLMClient accepts the known response envelopes") {
    CHECK(HttpLLMClient::parse_completion_body(
              R"({"choices": [{"message": {"role": "assistant", "content": "{\"category\": \"Taxes\"}"}}]})", kUrl) ==
          R"({"category": "Taxes"})");
    CHECK(HttpLLMClient::parse_completion_body(R"({"choices": [{"text": "legacy completion"}]})", kUrl) ==
          "legacy completion");
    CHECK(HttpLLMClient::parse_completion_body(R"({"output_text": "responses api"})", kUrl) == "responses api");
}

TEST_CASE("HttpLLMClient rejects bodies it cannot interpret") {
    CHECK_THROWS_WITH(HttpLLMClient::parse_completion_body("<html>502 Bad Gateway</html>", kUrl),
                      ContainsSubstring("Non-JSON response from http://localhost:8000/chat/completions"));
    CHECK_THROWS_WITH(HttpLLMClient::parse_completion_body(R"({"id": "x", "choices": []})", kUrl),
                      "Unexpected response shape: keys=['choices', 'id']");
    CHECK_THROWS_AS(HttpLLMClient::parse_completion_body("[1, 2]", kUrl), LLMError);
}

TEST_CASE("HttpLLMClient without a base URL fails before any request") {
    HttpLLMClient client("   ", "qwen3-4b", 30);
    CHECK(client.endpoint_url().empty());
    CHECK_THROWS_WITH(client.complete_prompt("hello", 10), ContainsSubstring("Missing LLM base URL"));
}

TEST_CASE("HttpLLMClient reports unreachable servers as LLMError") {
    HttpLLMClient client("http://127.0.0.1:9", "qwen3-4b", 2);
    CHECK_THROWS_AS(client.complete_prompt("hello", 10), LLMError);
}
