#ifndef SHA256_HASHER_HPP
#define SHA256_HASHER_HPP

#include <cstddef>
#include <memory>
#include <string>

/**
 * @brief Incremental SHA-256 over OpenSSL's EVP interface. finalize() returns
 * the lowercase hex digest and resets the hasher for reuse.
 */
class Sha256Hasher {
public:
    static constexpr std::size_t kHexLength = 64;

    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;

    void update(const void* data, std::size_t size);
    std::string finalize();

    static std::string hash(const std::string& data);

private:
    void init();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

#endif
