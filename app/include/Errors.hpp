#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Malformed rule set, invalid enumerated option or bad command-line value.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// I/O failure inside the content store (source unreadable, destination not creatable).
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

class ManifestError : public std::runtime_error {
public:
    explicit ManifestError(const std::string& message)
        : std::runtime_error(message) {}
};

class LinkError : public std::runtime_error {
public:
    explicit LinkError(const std::string& message)
        : std::runtime_error(message) {}
};

#endif
