// DAOSTAKE - Hash Functions Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/crypto/hash.h"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace daostake {
namespace crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

/// One-shot digest; OpenSSL failures are programming or environment errors
void Digest(const EVP_MD* md, const Byte* data, size_t len,
            Byte* out, unsigned int expected) {
    if (md == nullptr) {
        throw std::runtime_error("digest algorithm unavailable");
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    unsigned int outLen = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out, &outLen) != 1 ||
        outLen != expected) {
        throw std::runtime_error("digest computation failed");
    }
}

} // anonymous namespace

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Byte out[Hash256::SIZE];
    Digest(EVP_sha256(), data, len, out, Hash256::SIZE);
    return Hash256(out, sizeof(out));
}

Hash160 ComputeHash160(const Byte* data, size_t len) {
    Hash256 sha = SHA256Hash(data, len);
    Byte out[Hash160::SIZE];
    Digest(EVP_ripemd160(), sha.data(), sha.size(), out, Hash160::SIZE);
    return Hash160(out, sizeof(out));
}

Address AddressFromLabel(const std::string& label) {
    return ComputeHash160(reinterpret_cast<const Byte*>(label.data()), label.size());
}

Address ResolveAddress(const std::string& text) {
    if (auto parsed = Address::FromHex(text)) {
        return *parsed;
    }
    return AddressFromLabel(text);
}

} // namespace crypto
} // namespace daostake
