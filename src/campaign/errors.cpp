// CROWDFUND - Campaign Errors Implementation
// Copyright (c) 2024 CROWDFUND Developers
// MIT License

#include "crowdfund/campaign/errors.h"

namespace crowdfund {
namespace campaign {

const char* CampaignErrorToString(CampaignError error) {
    switch (error) {
        case CampaignError::None:      return "None";
        case CampaignError::Config:    return "Config";
        case CampaignError::Window:    return "Window";
        case CampaignError::State:     return "State";
        case CampaignError::Bounds:    return "Bounds";
        case CampaignError::Transport: return "Transport";
        case CampaignError::Balance:   return "Balance";
        default:                       return "Unknown";
    }
}

std::string CampaignResult::ToString() const {
    if (IsOk()) {
        return "ok";
    }
    return std::string(CampaignErrorToString(error)) + ": " + reason;
}

} // namespace campaign
} // namespace crowdfund
