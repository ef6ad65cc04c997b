#ifndef FAKE_LLM_CLIENT_HPP
#define FAKE_LLM_CLIENT_HPP

#include "ILLMClient.hpp"
#include "LLMErrors.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

// Answers every prompt through a caller-supplied responder and records the prompts it saw.
class FakeLLMClient : public ILLMClient {
public:
    using Responder = std::function<std::string(const std::string& prompt)>;

    explicit FakeLLMClient(Responder responder)
        : responder(std::move(responder)) {}

    static FakeLLMClient replying(std::string reply)
    {
        return FakeLLMClient([reply = std::move(reply)](const std::string&) { return reply; });
    }

    static FakeLLMClient failing(std::string message)
    {
        return FakeLLMClient([message = std::move(message)](const std::string&) -> std::string {
            throw LLMError(message);
        });
    }

    std::string complete_prompt(const std::string& prompt, int max_tokens) override
    {
        prompts.push_back(prompt);
        last_max_tokens = max_tokens;
        return responder(prompt);
    }

    std::string provider_name() const override { return "fake"; }
    std::string model_name() const override { return "test-model"; }

    std::vector<std::string> prompts;
    int last_max_tokens = 0;

private:
    Responder responder;
};

#endif
