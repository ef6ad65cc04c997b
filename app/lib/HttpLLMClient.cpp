#include "HttpLLMClient.hpp"

#include "LLMErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <json/json.h>

#include <memory>
#include <mutex>

namespace {

constexpr std::size_t kMaxBodyInError = 800;

size_t write_callback(char* data, size_t size, size_t nmemb, void* userdata)
{
    auto* response = static_cast<std::string*>(userdata);
    response->append(data, size * nmemb);
    return size * nmemb;
}

void ensure_curl_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

std::string body_excerpt(const std::string& body)
{
    return Utils::truncate_utf8(body, kMaxBodyInError);
}

std::string sorted_keys(const Json::Value& value)
{
    // jsoncpp keeps object members ordered by key.
    std::string joined;
    for (const auto& key : value.getMemberNames()) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += "'" + key + "'";
    }
    return "[" + joined + "]";
}

} // namespace

HttpLLMClient::HttpLLMClient(std::string base_url, std::string model, double timeout_seconds)
    : model(std::move(model)),
      timeout_seconds(timeout_seconds),
      endpoint(make_endpoint(base_url)) {}

std::string HttpLLMClient::make_endpoint(const std::string& base_url)
{
    std::string base = Utils::trim_copy(base_url);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (base.empty()) {
        return std::string();
    }
    return base + "/chat/completions";
}

std::string HttpLLMClient::build_request_body(const std::string& prompt, const std::string& model, int max_tokens)
{
    Json::Value payload(Json::objectValue);
    Json::Value message(Json::objectValue);
    message["role"] = "user";
    message["content"] = prompt;
    payload["messages"] = Json::Value(Json::arrayValue);
    payload["messages"].append(message);
    payload["max_completion_tokens"] = max_tokens;
    payload["temperature"] = 0;
    payload["stream"] = false;
    if (!model.empty()) {
        payload["model"] = model;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, payload);
}

std::string HttpLLMClient::parse_completion_body(const std::string& body, const std::string& url)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw LLMError(fmt::format("Non-JSON response from {}: {}", url, body_excerpt(body)));
    }
    if (!root.isObject()) {
        throw LLMError(fmt::format("Unexpected response shape from {}: not an object", url));
    }

    const Json::Value& choices = root["choices"];
    if (choices.isArray() && !choices.empty() && choices[0].isObject()) {
        const Json::Value& first = choices[0];
        const Json::Value& message = first["message"];
        if (message.isObject() && message["content"].isString()) {
            return message["content"].asString();
        }
        if (first["text"].isString()) {
            return first["text"].asString();
        }
    }
    if (root["output_text"].isString()) {
        return root["output_text"].asString();
    }
    throw LLMError(fmt::format("Unexpected response shape: keys={}", sorted_keys(root)));
}

std::string HttpLLMClient::complete_prompt(const std::string& prompt, int max_tokens)
{
    if (endpoint.empty()) {
        throw LLMError("Missing LLM base URL (e.g. http://localhost:8000); set DOCVAULT_LLM_BASE_URL");
    }

    ensure_curl_initialized();
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw LLMError("Failed to initialize curl");
    }

    const std::string payload = build_request_body(prompt, model, max_tokens);
    std::string response_body;

    std::unique_ptr<curl_slist, HeaderListDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    const long timeout_ms = static_cast<long>(timeout_seconds * 1000.0);
    curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (timeout_ms > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    }

    auto logger = Logger::get_logger(Logger::kLLMLogger);
    if (logger) {
        logger->debug("POST {} ({} prompt bytes, max_tokens={})", endpoint, prompt.size(), max_tokens);
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw LLMError(fmt::format("Network error calling {}: {}", endpoint, curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
        throw LLMError(fmt::format("HTTP {} from {}: {}", http_code, endpoint, body_excerpt(response_body)));
    }

    std::string content = parse_completion_body(response_body, endpoint);
    if (logger) {
        logger->debug("Completion from {}: {}", endpoint, Utils::truncate_utf8(content, 400));
    }
    return content;
}
