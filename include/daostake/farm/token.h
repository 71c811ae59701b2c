// DAOSTAKE - Collaborator Interfaces
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// The engine consumes external token contracts and the host chain only
// through these interfaces. Mutating token calls return false on
// failure; the engine turns that into COLLABORATOR_FAILURE and aborts.

#ifndef DAOSTAKE_FARM_TOKEN_H
#define DAOSTAKE_FARM_TOKEN_H

#include "daostake/core/types.h"

namespace daostake {
namespace farm {

// ============================================================================
// Token Interfaces
// ============================================================================

/// Standard fungible token (staked assets and the reward token)
class IFungibleToken {
public:
    virtual ~IFungibleToken() = default;

    /// Move `amount` from `caller` to `to`
    virtual bool Transfer(const Address& caller, const Address& to,
                          const Amount& amount) = 0;

    /// Move `amount` from `from` to `to` using the allowance granted to `caller`
    virtual bool TransferFrom(const Address& caller, const Address& from,
                              const Address& to, const Amount& amount) = 0;

    virtual Amount BalanceOf(const Address& account) const = 0;
};

/// Reward token: the engine is expected to be its owner and sole minter
class IMintableToken : public IFungibleToken {
public:
    /// Create `amount` for `to`; only the owner may mint
    virtual bool Mint(const Address& caller, const Address& to,
                      const Amount& amount) = 0;

    /// Hand ownership (and minting rights) to `newOwner`
    virtual bool TransferOwnership(const Address& caller, const Address& newOwner) = 0;

    virtual Address Owner() const = 0;
};

// ============================================================================
// Chain Context
// ============================================================================

/// What the engine needs to know about its host chain
class IChainContext {
public:
    virtual ~IChainContext() = default;

    virtual BlockNumber CurrentBlock() const = 0;

    /// True for programmable accounts (token contracts, the engine itself)
    virtual bool IsContract(const Address& address) const = 0;

    /// Token contract at `address`, nullptr if there is none
    virtual IFungibleToken* GetToken(const Address& address) = 0;

    /// Mintable token contract at `address`, nullptr if there is none
    virtual IMintableToken* GetMintableToken(const Address& address) = 0;
};

} // namespace farm
} // namespace daostake

#endif // DAOSTAKE_FARM_TOKEN_H
