// CROWDFUND - SHA256 Hashing
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// SHA-256 through OpenSSL's EVP interface, plus deterministic derivation
// of participant addresses from human-readable labels.

#ifndef CROWDFUND_CRYPTO_SHA256_H
#define CROWDFUND_CRYPTO_SHA256_H

#include "crowdfund/core/types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace crowdfund {

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute SHA256 hash of a string
inline Hash256 SHA256Hash(const std::string& str) {
    return SHA256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

/**
 * Derive an address from a label: the first 20 bytes of SHA256(label).
 * Used by tools and tests to name participants ("alice", "recipient").
 */
Address AddressFromLabel(const std::string& label);

/**
 * Resolve an address string: 40 hex characters (optionally 0x-prefixed)
 * are parsed directly, anything else is treated as a label.
 * An empty string resolves to the null address.
 */
Address ResolveAddress(const std::string& str);

} // namespace crowdfund

#endif // CROWDFUND_CRYPTO_SHA256_H
