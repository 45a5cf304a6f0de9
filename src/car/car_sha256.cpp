/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "car/car_sha256.h"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace atp::car {
namespace {
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
}  // namespace

Sha256Digest sha256(std::span<const std::uint8_t> payload) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error(std::string("SHA-256 context allocation failed"));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error(std::string("SHA-256 init failed"));
    }
    if (!payload.empty()) {
        if (EVP_DigestUpdate(ctx.get(), payload.data(), payload.size()) != 1) {
            throw std::runtime_error(std::string("SHA-256 update failed"));
        }
    }
    Sha256Digest out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 || out_len != out.size()) {
        throw std::runtime_error(std::string("SHA-256 final failed"));
    }
    return out;
}
}  // namespace atp::car
