#ifndef ILLM_CLIENT_HPP
#define ILLM_CLIENT_HPP

#include <string>

// Text-completion provider. Implementations throw LLMError on transport failure.
class ILLMClient {
public:
    virtual ~ILLMClient() = default;

    virtual std::string complete_prompt(const std::string& prompt, int max_tokens) = 0;

    virtual std::string provider_name() const = 0;
    virtual std::string model_name() const = 0;
};

#endif
