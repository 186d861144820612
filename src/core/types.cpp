// CROWDFUND - Core Types Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/core/types.h"
#include "crowdfund/core/hex.h"

namespace crowdfund {

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(bytes_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.size() != 2 * SIZE) {
        throw std::invalid_argument("expected " + std::to_string(2 * SIZE) +
                                    " hex digits, got " + std::to_string(hex.size()));
    }
    std::vector<uint8_t> raw = HexToBytes(hex);
    return BaseHash(raw.data(), raw.size());
}

template class BaseHash<256>;
template class BaseHash<160>;

bool Address::TryParse(const std::string& str, Address& out) {
    std::string digits = StripHexPrefix(str);
    if (digits.size() != 2 * SIZE || !IsValidHex(digits)) {
        return false;
    }
    out = Address(Hash160::FromHex(digits));
    return true;
}

} // namespace crowdfund
