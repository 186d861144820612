// CROWDFUND - Campaign Events Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/campaign/events.h"
#include "crowdfund/core/arith.h"

#include <sstream>

namespace crowdfund {
namespace campaign {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::ContributionAccepted: return "ContributionAccepted";
        case EventType::Settled:              return "Settled";
        case EventType::Failed:               return "Failed";
        case EventType::Withdrawn:            return "Withdrawn";
        case EventType::ShareTransfer:        return "ShareTransfer";
        case EventType::YieldDeposited:       return "YieldDeposited";
        case EventType::FeeScheduleApplied:   return "FeeScheduleApplied";
        case EventType::FeePaid:              return "FeePaid";
        case EventType::Approval:             return "Approval";
        default:                              return "Unknown";
    }
}

std::string CampaignEvent::ToString() const {
    std::ostringstream oss;
    oss << EventTypeToString(type);

    switch (type) {
        case EventType::Failed:
            break;
        case EventType::FeeScheduleApplied:
            oss << " collector=" << account.ToString()
                << " upfront=" << upfrontBips << " payout=" << payoutBips;
            break;
        case EventType::ShareTransfer:
            oss << " from=" << account.ToString() << " to=" << counterparty.ToString()
                << " amount=" << AmountToString(amount);
            break;
        case EventType::Approval:
            oss << " owner=" << account.ToString() << " spender=" << counterparty.ToString()
                << " amount=" << AmountToString(amount);
            break;
        default:
            oss << " account=" << account.ToString() << " amount=" << AmountToString(amount);
            break;
    }

    return oss.str();
}

} // namespace campaign
} // namespace crowdfund
