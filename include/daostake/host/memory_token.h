// DAOSTAKE - In-Memory Token
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Fungible token with an owner-only mint, used as both the reward token
// and the staked LP tokens when the engine runs on a LocalChain.

#ifndef DAOSTAKE_HOST_MEMORY_TOKEN_H
#define DAOSTAKE_HOST_MEMORY_TOKEN_H

#include "daostake/core/types.h"
#include "daostake/farm/token.h"

#include <functional>
#include <map>
#include <string>
#include <utility>

namespace daostake {
namespace host {

class MemoryToken : public farm::IMintableToken {
public:
    /// Called after a successful Transfer/TransferFrom (receive hook)
    using TransferHook = std::function<void(const Address& from, const Address& to,
                                            const Amount& amount)>;

    /// Token state that LocalChain snapshots around each call
    struct Snapshot {
        std::map<Address, Amount> balances;
        std::map<std::pair<Address, Address>, Amount> allowances;
        Amount totalSupply{0};
        Address owner;
    };

    MemoryToken(const std::string& symbol, const Address& address, const Address& owner);

    // IFungibleToken
    bool Transfer(const Address& caller, const Address& to, const Amount& amount) override;
    bool TransferFrom(const Address& caller, const Address& from,
                      const Address& to, const Amount& amount) override;
    Amount BalanceOf(const Address& account) const override;

    // IMintableToken
    bool Mint(const Address& caller, const Address& to, const Amount& amount) override;
    bool TransferOwnership(const Address& caller, const Address& newOwner) override;
    Address Owner() const override { return owner_; }

    /// Let `spender` move up to `amount` of `owner`'s balance
    bool Approve(const Address& owner, const Address& spender, const Amount& amount);

    Amount Allowance(const Address& owner, const Address& spender) const;

    const Amount& TotalSupply() const { return totalSupply_; }
    const std::string& Symbol() const { return symbol_; }
    const Address& GetAddress() const { return address_; }

    /// Make every subsequent Mint return false
    void SetFailMints(bool fail) { failMints_ = fail; }

    /// Make every subsequent Transfer/TransferFrom return false
    void SetFailTransfers(bool fail) { failTransfers_ = fail; }

    void SetTransferHook(TransferHook hook) { transferHook_ = std::move(hook); }

    Snapshot TakeSnapshot() const;
    void Restore(const Snapshot& snapshot);

private:
    bool Move(const Address& from, const Address& to, const Amount& amount);

    std::string symbol_;
    Address address_;
    Address owner_;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    Amount totalSupply_{0};

    bool failMints_{false};
    bool failTransfers_{false};
    TransferHook transferHook_;
};

} // namespace host
} // namespace daostake

#endif // DAOSTAKE_HOST_MEMORY_TOKEN_H
