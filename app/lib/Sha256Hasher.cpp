#include "Sha256Hasher.hpp"

#include <openssl/evp.h>
#include <fmt/format.h>

#include <array>
#include <stdexcept>

struct Sha256Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    init();
}

Sha256Hasher::~Sha256Hasher() = default;

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;

void Sha256Hasher::init() {
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
}

void Sha256Hasher::update(const void* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, size) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }
}

std::string Sha256Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    if (EVP_DigestFinal_ex(impl_->ctx, digest.data(), &digest_len) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }

    std::string result;
    result.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        result += fmt::format("{:02x}", digest[i]);
    }

    init();
    return result;
}

std::string Sha256Hasher::hash(const std::string& data) {
    Sha256Hasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finalize();
}
