// CROWDFUND - Checked Amount Arithmetic
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Overflow-checked helpers for ledger arithmetic. Products of two amounts
// can exceed 128 bits (shares * yield), so MulDiv and the yield helpers
// evaluate them with OpenSSL BIGNUMs before the floor division.

#ifndef CROWDFUND_CORE_ARITH_H
#define CROWDFUND_CORE_ARITH_H

#include "crowdfund/core/types.h"

#include <openssl/bn.h>

#include <cstdint>
#include <optional>
#include <string>

namespace crowdfund {

/// Basis point denominator (10000 = 100%)
constexpr int64_t BIPS_DENOMINATOR = 10000;

/// a + b, or nullopt on overflow or negative operands
std::optional<Amount> CheckedAdd(Amount a, Amount b);

/// a - b, or nullopt if the result would be negative
std::optional<Amount> CheckedSub(Amount a, Amount b);

/**
 * floor(a * b / d) computed without intermediate overflow.
 *
 * @return nullopt if d <= 0, an operand is negative, or the quotient
 *         does not fit in an Amount
 */
std::optional<Amount> MulDiv(Amount a, Amount b, Amount d);

/// floor(amount * bips / 10000); bips outside [0, 10000] yield nullopt
std::optional<Amount> ApplyBips(Amount amount, int bips);

/// Format an amount with thousands separators ("3,000,000")
std::string FormatAmount(Amount amount);

/// Plain decimal digits, with a leading '-' when negative
std::string AmountToString(Amount amount);

/**
 * Parse "123", "3e17" or "1.5e18" into base units. Fractions must vanish
 * after the exponent is applied; nullopt on anything else or on overflow.
 */
std::optional<Amount> ParseAmount(const std::string& str);

// ============================================================================
// BIGNUM Conversion
// ============================================================================

/// Load `value` (either sign) into `bn`
bool AmountToBN(Amount value, BIGNUM* bn);

/// nullopt when `bn` is outside the Amount range
std::optional<Amount> AmountFromBN(const BIGNUM* bn);

} // namespace crowdfund

#endif // CROWDFUND_CORE_ARITH_H
