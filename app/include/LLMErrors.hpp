#ifndef LLM_ERRORS_HPP
#define LLM_ERRORS_HPP

#include <stdexcept>
#include <string>

// Transport-level failure of the completion provider: unreachable host, timeout,
// non-2xx status, a body that is not JSON, or an envelope without any text.
class LLMError : public std::runtime_error {
public:
    explicit LLMError(const std::string& message)
        : std::runtime_error(message) {}
};

#endif
