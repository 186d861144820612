// CROWDFUND - SHA256 Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace crowdfund {

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Byte digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    
    if (EVP_Digest(data, len, digest, &digestLen, EVP_sha256(), nullptr) != 1 ||
        digestLen != Hash256::SIZE) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    
    return Hash256(digest, digestLen);
}

Address AddressFromLabel(const std::string& label) {
    Hash256 digest = SHA256Hash(label);
    return Address(Hash160(digest.data(), Hash160::SIZE));
}

Address ResolveAddress(const std::string& str) {
    if (str.empty()) {
        return Address();
    }
    Address parsed;
    if (Address::TryParse(str, parsed)) {
        return parsed;
    }
    return AddressFromLabel(str);
}

} // namespace crowdfund
