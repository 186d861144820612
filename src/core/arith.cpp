// CROWDFUND - Checked Amount Arithmetic Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/core/arith.h"

#include <algorithm>
#include <string>

namespace crowdfund {

namespace {

using Magnitude = unsigned __int128;

constexpr int AMOUNT_BYTES = 16;

Magnitude MagnitudeOf(Amount value) {
    return value < 0 ? Magnitude(0) - static_cast<Magnitude>(value)
                     : static_cast<Magnitude>(value);
}

} // namespace

// ============================================================================
// BIGNUM Conversion
// ============================================================================

bool AmountToBN(Amount value, BIGNUM* bn) {
    Magnitude mag = MagnitudeOf(value);
    unsigned char buf[AMOUNT_BYTES];
    for (int i = AMOUNT_BYTES - 1; i >= 0; --i) {
        buf[i] = static_cast<unsigned char>(mag & 0xff);
        mag >>= 8;
    }
    if (BN_bin2bn(buf, AMOUNT_BYTES, bn) == nullptr) {
        return false;
    }
    BN_set_negative(bn, value < 0 ? 1 : 0);
    return true;
}

std::optional<Amount> AmountFromBN(const BIGNUM* bn) {
    // The magnitude must stay below 2^127
    if (BN_num_bits(bn) > 127) {
        return std::nullopt;
    }
    unsigned char buf[AMOUNT_BYTES];
    if (BN_bn2binpad(bn, buf, AMOUNT_BYTES) != AMOUNT_BYTES) {
        return std::nullopt;
    }
    Magnitude mag = 0;
    for (unsigned char byte : buf) {
        mag = (mag << 8) | byte;
    }
    Amount value = static_cast<Amount>(mag);
    return BN_is_negative(bn) ? -value : value;
}

// ============================================================================
// Checked Operations
// ============================================================================

std::optional<Amount> CheckedAdd(Amount a, Amount b) {
    if (a < 0 || b < 0) {
        return std::nullopt;
    }
    if (a > MAX_AMOUNT - b) {
        return std::nullopt;
    }
    return a + b;
}

std::optional<Amount> CheckedSub(Amount a, Amount b) {
    if (a < 0 || b < 0 || b > a) {
        return std::nullopt;
    }
    return a - b;
}

std::optional<Amount> MulDiv(Amount a, Amount b, Amount d) {
    if (a < 0 || b < 0 || d <= 0) {
        return std::nullopt;
    }
    if (a == 0 || b == 0) {
        return Amount{0};
    }

    BIGNUM* x = BN_new();
    BIGNUM* y = BN_new();
    BIGNUM* div = BN_new();
    BIGNUM* quot = BN_new();
    BN_CTX* ctx = BN_CTX_new();

    std::optional<Amount> result;

    if (x && y && div && quot && ctx &&
        AmountToBN(a, x) && AmountToBN(b, y) && AmountToBN(d, div) &&
        BN_mul(x, x, y, ctx) == 1 &&
        BN_div(quot, nullptr, x, div, ctx) == 1) {
        result = AmountFromBN(quot);
    }

    BN_free(x); BN_free(y); BN_free(div); BN_free(quot); BN_CTX_free(ctx);
    return result;
}

std::optional<Amount> ApplyBips(Amount amount, int bips) {
    if (bips < 0 || bips > BIPS_DENOMINATOR) {
        return std::nullopt;
    }
    return MulDiv(amount, bips, BIPS_DENOMINATOR);
}

// ============================================================================
// Text
// ============================================================================

std::string AmountToString(Amount amount) {
    Magnitude mag = MagnitudeOf(amount);
    std::string digits;
    do {
        digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    } while (mag != 0);
    if (amount < 0) {
        digits.push_back('-');
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string FormatAmount(Amount amount) {
    std::string digits = AmountToString(amount);
    size_t first = amount < 0 ? 1 : 0;
    std::string result;
    int count = 0;
    for (size_t i = digits.size(); i-- > first;) {
        if (count > 0 && count % 3 == 0) {
            result.insert(result.begin(), ',');
        }
        result.insert(result.begin(), digits[i]);
        ++count;
    }
    if (amount < 0) {
        result.insert(result.begin(), '-');
    }
    return result;
}

std::optional<Amount> ParseAmount(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    std::string mantissa = str;
    int exponent = 0;
    size_t e = str.find_first_of("eE");
    if (e != std::string::npos) {
        mantissa = str.substr(0, e);
        std::string exp = str.substr(e + 1);
        if (exp.empty() || exp.size() > 2 ||
            exp.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        exponent = std::stoi(exp);
    }

    size_t dot = mantissa.find('.');
    std::string digits = mantissa;
    if (dot != std::string::npos) {
        std::string frac = mantissa.substr(dot + 1);
        digits = mantissa.substr(0, dot) + frac;
        exponent -= static_cast<int>(frac.size());
    }
    if (digits.empty() || exponent < 0 ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    Amount value = 0;
    for (char c : digits) {
        int digit = c - '0';
        if (value > (MAX_AMOUNT - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    for (int i = 0; i < exponent; ++i) {
        if (value > MAX_AMOUNT / 10) {
            return std::nullopt;
        }
        value *= 10;
    }
    return value;
}

} // namespace crowdfund
