// CROWDFUND - Campaign Errors
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Error taxonomy and result type returned by every campaign operation.

#ifndef CROWDFUND_CAMPAIGN_ERRORS_H
#define CROWDFUND_CAMPAIGN_ERRORS_H

#include "crowdfund/core/types.h"

#include <string>

namespace crowdfund {
namespace campaign {

// ============================================================================
// Error Categories
// ============================================================================

enum class CampaignError {
    /// Operation succeeded
    None,

    /// Invalid initialization parameters
    Config,

    /// Outside the contribution window or a resolution gate is closed
    Window,

    /// Operation not valid in the current lifecycle state
    State,

    /// Amount outside the allowed range
    Bounds,

    /// Value transport failed or delivered an unexpected amount
    Transport,

    /// Nothing to withdraw, insufficient shares or allowance
    Balance
};

/// Convert error category to string
const char* CampaignErrorToString(CampaignError error);

// ============================================================================
// Rejection Reasons
// ============================================================================

namespace Reason {
    constexpr const char* WINDOW_CLOSED = "contribution window closed";
    constexpr const char* BELOW_MINIMUM = "amount below per-account minimum";
    constexpr const char* ABOVE_MAXIMUM = "amount above per-account maximum";
    constexpr const char* GOAL_MAX_EXCEEDED = "goal-max exceeded";
    constexpr const char* NON_POSITIVE = "amount must be positive";
    constexpr const char* TRANSPORT_FAILED = "transport failed";
    constexpr const char* SHORT_DELIVERY = "transport delivered less than requested";
    constexpr const char* OVER_DELIVERY = "transport delivered more than requested";
    constexpr const char* NO_BALANCE = "no balance";
    constexpr const char* INSUFFICIENT_BALANCE = "insufficient balance";
    constexpr const char* INVALID_RECIPIENT = "invalid recipient";
    constexpr const char* INSUFFICIENT_ALLOWANCE = "insufficient allowance";
    constexpr const char* AMOUNT_OVERFLOW = "amount overflow";
    constexpr const char* NOT_INITIALIZED = "campaign not initialized";
    constexpr const char* ALREADY_INITIALIZED = "campaign already initialized";
    constexpr const char* NOT_FUNDING = "campaign already resolved";
    constexpr const char* SETTLEMENT_CLOSED = "settlement not allowed yet";
    constexpr const char* UNLOCK_CLOSED = "failure release not allowed yet";
    constexpr const char* NOT_FUNDED = "campaign not funded";
    constexpr const char* STILL_FUNDING = "campaign still funding";
}

// ============================================================================
// Result
// ============================================================================

/**
 * Outcome of a campaign operation.
 *
 * On success `amount` carries the operation's primary quantity (net
 * contribution, refund, payout); on failure `reason` names the violated rule.
 */
struct CampaignResult {
    CampaignError error{CampaignError::None};
    std::string reason;
    Amount amount{0};

    bool IsOk() const { return error == CampaignError::None; }
    explicit operator bool() const { return IsOk(); }

    static CampaignResult Success(Amount amount = 0) {
        return {CampaignError::None, "", amount};
    }

    static CampaignResult Failure(CampaignError error, const std::string& reason) {
        return {error, reason, 0};
    }

    /// "Bounds: goal-max exceeded" or "ok"
    std::string ToString() const;
};

} // namespace campaign
} // namespace crowdfund

#endif // CROWDFUND_CAMPAIGN_ERRORS_H
