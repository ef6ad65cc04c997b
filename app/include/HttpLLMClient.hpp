#ifndef HTTP_LLM_CLIENT_HPP
#define HTTP_LLM_CLIENT_HPP

#include "ILLMClient.hpp"

#include <string>

/**
 * @brief OpenAI-compatible chat-completions client for a locally hosted model server.
 *
 * POSTs {"messages":[{"role":"user","content":...}], "max_completion_tokens":N,
 * "temperature":0, "stream":false, "model":...} to <base_url>/chat/completions.
 * Network failure, timeout, a non-2xx status, a non-JSON body or an unknown
 * response envelope raise LLMError.
 */
class HttpLLMClient : public ILLMClient {
public:
    HttpLLMClient(std::string base_url, std::string model, double timeout_seconds);

    std::string complete_prompt(const std::string& prompt, int max_tokens) override;

    std::string provider_name() const override { return "http"; }
    std::string model_name() const override { return model; }

    const std::string& endpoint_url() const { return endpoint; }

    static std::string build_request_body(const std::string& prompt, const std::string& model, int max_tokens);

    // Pulls the completion text out of choices[0].message.content, choices[0].text or output_text.
    static std::string parse_completion_body(const std::string& body, const std::string& url);

private:
    static std::string make_endpoint(const std::string& base_url);

    std::string model;
    double timeout_seconds;
    std::string endpoint;
};

#endif
