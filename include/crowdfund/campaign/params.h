// CROWDFUND - Campaign Parameters
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Write-once campaign configuration, its validation rules, and loading
// from a [campaign] configuration section.

#ifndef CROWDFUND_CAMPAIGN_PARAMS_H
#define CROWDFUND_CAMPAIGN_PARAMS_H

#include "crowdfund/campaign/errors.h"
#include "crowdfund/core/types.h"

#include <string>

namespace crowdfund {

namespace util {
class ConfigManager;
}

namespace campaign {

// ============================================================================
// Campaign Constants
// ============================================================================

/// Maximum fee in basis points (12.5%)
constexpr int MAX_FEE_BIPS = 1250;

/// Longest allowed contribution window
constexpr Timestamp MAX_CAMPAIGN_DURATION = 90 * SECONDS_PER_DAY;

/// Time after the window end at which unsettled funds become refundable
constexpr Timestamp STALE_FUNDS_WINDOW = 90 * SECONDS_PER_DAY;

// ============================================================================
// Denomination
// ============================================================================

/**
 * Unit the campaign is denominated in: the native currency, or an external
 * fungible token identified by its reference address.
 */
struct Denomination {
    enum class Kind {
        Native,
        ExternalFungible
    };

    Kind kind{Kind::Native};
    Address reference;

    static Denomination Native() { return {}; }

    static Denomination ExternalFungible(const Address& token) {
        return {Kind::ExternalFungible, token};
    }

    bool IsNative() const { return kind == Kind::Native; }

    bool operator==(const Denomination& other) const {
        return kind == other.kind && (IsNative() || reference == other.reference);
    }
    bool operator!=(const Denomination& other) const { return !(*this == other); }

    /// "native" or "token:<address>"
    std::string ToString() const;
};

// ============================================================================
// Campaign Configuration
// ============================================================================

/**
 * Parameters fixed at initialization.
 */
struct CampaignConfig {
    /// Receives the raised pool at settlement
    Address recipient;

    /// Receives upfront and payout fees (null when no fees are charged)
    Address feeCollector;

    /// Fee on the whole pool at settlement
    int upfrontFeeBips{0};

    /// Fee on each yield withdrawal
    int payoutFeeBips{0};

    Amount goalMin{0};
    Amount goalMax{0};

    /// Per-account cumulative contribution bounds
    Amount contributionMin{1};
    Amount contributionMax{0};

    /// Contribution window [startsAt, endsAt)
    Timestamp startsAt{0};
    Timestamp endsAt{0};

    Denomination denomination;

    bool HasFeeCollector() const { return !feeCollector.IsNull(); }

    /// Moment after which an unresolved campaign may be released as failed
    Timestamp ExpiresAt() const { return endsAt + STALE_FUNDS_WINDOW; }
};

/**
 * Check every configuration rule.
 * @return Success, or a Config failure naming the first violated rule
 */
CampaignResult ValidateConfig(const CampaignConfig& config);

/**
 * Read a campaign configuration from a config section.
 *
 * Keys: recipient, fee_collector, upfront_fee_bips, payout_fee_bips,
 * goal_min, goal_max, contribution_min, contribution_max, starts_at,
 * ends_at, denomination. Addresses are 40 hex characters or labels;
 * times are unix seconds or ISO 8601. The result is parsed but not
 * validated.
 */
CampaignResult LoadCampaignConfig(const util::ConfigManager& conf,
                                  const std::string& section,
                                  CampaignConfig& out);

/// Parse "native" or "token:<label-or-hex>"
bool ParseDenomination(const std::string& str, Denomination& out);

} // namespace campaign
} // namespace crowdfund

#endif // CROWDFUND_CAMPAIGN_PARAMS_H
