// DAOSTAKE - Hash Functions
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// SHA-256 and RIPEMD-160 digests (OpenSSL EVP) and address derivation.

#ifndef DAOSTAKE_CRYPTO_HASH_H
#define DAOSTAKE_CRYPTO_HASH_H

#include "daostake/core/types.h"

#include <cstddef>
#include <string>

namespace daostake {
namespace crypto {

/// SHA-256 of a byte range
Hash256 SHA256Hash(const Byte* data, size_t len);

/// RIPEMD160(SHA256(data))
Hash160 ComputeHash160(const Byte* data, size_t len);

/// Deterministic address for a human-readable account label
Address AddressFromLabel(const std::string& label);

/// Accept either a 40-char hex address or a label
Address ResolveAddress(const std::string& text);

} // namespace crypto
} // namespace daostake

#endif // DAOSTAKE_CRYPTO_HASH_H
