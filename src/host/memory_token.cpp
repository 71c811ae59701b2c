// DAOSTAKE - In-Memory Token Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/host/memory_token.h"
#include "daostake/util/logging.h"

namespace daostake {
namespace host {

MemoryToken::MemoryToken(const std::string& symbol, const Address& address, const Address& owner)
    : symbol_(symbol), address_(address), owner_(owner) {}

bool MemoryToken::Move(const Address& from, const Address& to, const Amount& amount) {
    if (failTransfers_) {
        LOG_DEBUG(util::LogCategory::TOKEN) << symbol_ << ": transfer failure injected";
        return false;
    }
    if (to.IsNull()) {
        return false;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << symbol_ << ": insufficient balance for "
                                            << from.ToHex();
        return false;
    }
    it->second -= amount;
    balances_[to] += amount;

    if (transferHook_) {
        transferHook_(from, to, amount);
    }
    return true;
}

bool MemoryToken::Transfer(const Address& caller, const Address& to, const Amount& amount) {
    return Move(caller, to, amount);
}

bool MemoryToken::TransferFrom(const Address& caller, const Address& from,
                               const Address& to, const Amount& amount) {
    auto key = std::make_pair(from, caller);
    auto it = allowances_.find(key);
    if (it == allowances_.end() || it->second < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << symbol_ << ": allowance of " << caller.ToHex()
                                            << " too low";
        return false;
    }
    Amount previous = it->second;
    it->second -= amount;
    if (!Move(from, to, amount)) {
        allowances_[key] = previous;
        return false;
    }
    return true;
}

Amount MemoryToken::BalanceOf(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? Amount(0) : it->second;
}

bool MemoryToken::Mint(const Address& caller, const Address& to, const Amount& amount) {
    if (failMints_ || caller != owner_ || to.IsNull()) {
        return false;
    }
    totalSupply_ += amount;
    balances_[to] += amount;
    return true;
}

bool MemoryToken::TransferOwnership(const Address& caller, const Address& newOwner) {
    if (caller != owner_ || newOwner.IsNull()) {
        return false;
    }
    owner_ = newOwner;
    return true;
}

bool MemoryToken::Approve(const Address& owner, const Address& spender, const Amount& amount) {
    if (spender.IsNull()) {
        return false;
    }
    allowances_[std::make_pair(owner, spender)] = amount;
    return true;
}

Amount MemoryToken::Allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find(std::make_pair(owner, spender));
    return it == allowances_.end() ? Amount(0) : it->second;
}

MemoryToken::Snapshot MemoryToken::TakeSnapshot() const {
    Snapshot snapshot;
    snapshot.balances = balances_;
    snapshot.allowances = allowances_;
    snapshot.totalSupply = totalSupply_;
    snapshot.owner = owner_;
    return snapshot;
}

void MemoryToken::Restore(const Snapshot& snapshot) {
    balances_ = snapshot.balances;
    allowances_ = snapshot.allowances;
    totalSupply_ = snapshot.totalSupply;
    owner_ = snapshot.owner;
}

} // namespace host
} // namespace daostake
