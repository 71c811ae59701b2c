// DAOSTAKE - Farm Errors
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Every failing engine operation throws FarmError. The enclosing
// operation is rolled back before the exception leaves the engine.

#ifndef DAOSTAKE_FARM_ERRORS_H
#define DAOSTAKE_FARM_ERRORS_H

#include <stdexcept>
#include <string>

namespace daostake {
namespace farm {

// ============================================================================
// Error Codes
// ============================================================================

enum class FarmErrorCode {
    NOT_AUTHORIZED,          // Caller lacks the admin capability
    WALLET_IS_CONTRACT,      // Beneficiary wallet must be externally owned
    INVALID_ADDRESS,         // Null address where one is required
    EMISSION_ENDED,          // Pool added at or after the end block
    INVALID_TOKEN,           // LP token is not a contract
    DUPLICATE_POOL,          // LP token already has a pool
    UNKNOWN_POOL,            // Pool id out of range
    INVALID_PERIOD,          // Period outside [1, P]
    INVALID_PARAMS,          // Malformed emission parameters or config
    INSUFFICIENT_BALANCE,    // Withdraw exceeds recorded stake
    COLLABORATOR_FAILURE,    // Token mint/transfer reported failure
    REENTRANT_CALL,          // Engine entered from inside a token call
    LEDGER_INVARIANT,        // Bookkeeping invariant violated
};

/// Broad classes used for reporting
enum class FarmErrorCategory {
    Configuration,
    Permission,
    InsufficientBalance,
    Collaborator,
    Internal,
};

const char* FarmErrorCodeToString(FarmErrorCode code);

const char* FarmErrorCategoryToString(FarmErrorCategory category);

// ============================================================================
// FarmError
// ============================================================================

class FarmError : public std::runtime_error {
public:
    FarmError(FarmErrorCode code, const std::string& msg)
        : std::runtime_error(std::string(FarmErrorCodeToString(code)) + ": " + msg)
        , code_(code) {}

    FarmErrorCode Code() const { return code_; }

    FarmErrorCategory Category() const;

private:
    FarmErrorCode code_;
};

} // namespace farm
} // namespace daostake

#endif // DAOSTAKE_FARM_ERRORS_H
