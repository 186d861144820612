// CROWDFUND - Campaign Events
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Notifications emitted by a campaign after each successful operation.

#ifndef CROWDFUND_CAMPAIGN_EVENTS_H
#define CROWDFUND_CAMPAIGN_EVENTS_H

#include "crowdfund/core/types.h"

#include <functional>
#include <string>

namespace crowdfund {
namespace campaign {

enum class EventType {
    /// account, amount (net shares credited)
    ContributionAccepted,

    /// account = settlement target, amount = net pool sent
    Settled,

    /// Campaign released as failed
    Failed,

    /// account, amount (net paid to the account)
    Withdrawn,

    /// account = from, counterparty = to, amount
    ShareTransfer,

    /// account = depositor, amount = net yield credited
    YieldDeposited,

    /// account = collector, upfrontBips, payoutBips
    FeeScheduleApplied,

    /// account = collector, amount
    FeePaid,

    /// account = owner, counterparty = spender, amount
    Approval
};

const char* EventTypeToString(EventType type);

/**
 * A single campaign event. Field meaning depends on the type; unused
 * fields stay zero or null.
 */
struct CampaignEvent {
    EventType type{EventType::ContributionAccepted};
    Address account;
    Address counterparty;
    Amount amount{0};
    int upfrontBips{0};
    int payoutBips{0};
    Timestamp time{0};

    /// "Withdrawn account=0x.. amount=.."
    std::string ToString() const;
};

/// Observer callback registered with Campaign::Subscribe
using EventCallback = std::function<void(const CampaignEvent&)>;

} // namespace campaign
} // namespace crowdfund

#endif // CROWDFUND_CAMPAIGN_EVENTS_H
