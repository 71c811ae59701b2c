// DAOSTAKE - Farm Errors Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/farm/errors.h"

namespace daostake {
namespace farm {

const char* FarmErrorCodeToString(FarmErrorCode code) {
    switch (code) {
        case FarmErrorCode::NOT_AUTHORIZED: return "not-authorized";
        case FarmErrorCode::WALLET_IS_CONTRACT: return "wallet-is-contract";
        case FarmErrorCode::INVALID_ADDRESS: return "invalid-address";
        case FarmErrorCode::EMISSION_ENDED: return "emission-ended";
        case FarmErrorCode::INVALID_TOKEN: return "invalid-token";
        case FarmErrorCode::DUPLICATE_POOL: return "duplicate-pool";
        case FarmErrorCode::UNKNOWN_POOL: return "unknown-pool";
        case FarmErrorCode::INVALID_PERIOD: return "invalid-period";
        case FarmErrorCode::INVALID_PARAMS: return "invalid-params";
        case FarmErrorCode::INSUFFICIENT_BALANCE: return "insufficient-balance";
        case FarmErrorCode::COLLABORATOR_FAILURE: return "collaborator-failure";
        case FarmErrorCode::REENTRANT_CALL: return "reentrant-call";
        case FarmErrorCode::LEDGER_INVARIANT: return "ledger-invariant";
        default: return "unknown-error";
    }
}

const char* FarmErrorCategoryToString(FarmErrorCategory category) {
    switch (category) {
        case FarmErrorCategory::Configuration: return "configuration";
        case FarmErrorCategory::Permission: return "permission";
        case FarmErrorCategory::InsufficientBalance: return "insufficient-balance";
        case FarmErrorCategory::Collaborator: return "collaborator";
        case FarmErrorCategory::Internal: return "internal";
        default: return "unknown";
    }
}

FarmErrorCategory FarmError::Category() const {
    switch (code_) {
        case FarmErrorCode::NOT_AUTHORIZED:
            return FarmErrorCategory::Permission;
        case FarmErrorCode::WALLET_IS_CONTRACT:
        case FarmErrorCode::INVALID_ADDRESS:
        case FarmErrorCode::EMISSION_ENDED:
        case FarmErrorCode::INVALID_TOKEN:
        case FarmErrorCode::DUPLICATE_POOL:
        case FarmErrorCode::UNKNOWN_POOL:
        case FarmErrorCode::INVALID_PARAMS:
            return FarmErrorCategory::Configuration;
        case FarmErrorCode::INSUFFICIENT_BALANCE:
            return FarmErrorCategory::InsufficientBalance;
        case FarmErrorCode::COLLABORATOR_FAILURE:
        case FarmErrorCode::REENTRANT_CALL:
            return FarmErrorCategory::Collaborator;
        default:
            return FarmErrorCategory::Internal;
    }
}

} // namespace farm
} // namespace daostake
