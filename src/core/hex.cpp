// CROWDFUND - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/core/hex.h"

#include <stdexcept>

namespace crowdfund {

namespace {

/// Value of one hex digit, or -1
int DigitValue(char c) {
    switch (c) {
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
            return c - '0';
        case 'a': case 'b': case 'c': case 'd': case 'e': case 'f':
            return 10 + (c - 'a');
        case 'A': case 'B': case 'C': case 'D': case 'E': case 'F':
            return 10 + (c - 'A');
        default:
            return -1;
    }
}

} // namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out(2 * len, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = digits[data[i] / 16];
        out[2 * i + 1] = digits[data[i] % 16];
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("odd number of hex digits");
    }
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = DigitValue(hex[2 * i]);
        int lo = DigitValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("not a hex digit in \"" + hex + "\"");
        }
        out[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (DigitValue(c) < 0) return false;
    }
    return true;
}

std::string StripHexPrefix(const std::string& str) {
    bool prefixed = str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
    return prefixed ? str.substr(2) : str;
}

} // namespace crowdfund
