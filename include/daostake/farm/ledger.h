// DAOSTAKE - User Ledger
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Stake and reward debt per (pool, user). Positions are created on first
// touch and never deleted; a zero stake is a valid terminal state.

#ifndef DAOSTAKE_FARM_LEDGER_H
#define DAOSTAKE_FARM_LEDGER_H

#include "daostake/core/types.h"

#include <functional>
#include <map>
#include <utility>

namespace daostake {
namespace farm {

struct UserPosition {
    /// Currently deposited balance
    Amount stakeAmount{0};

    /// stakeAmount * accRewardPerShare / 1e18 at the last settlement point
    Amount rewardDebt{0};

    bool IsStaked() const { return stakeAmount > 0; }

    bool operator==(const UserPosition& other) const {
        return stakeAmount == other.stakeAmount && rewardDebt == other.rewardDebt;
    }
};

class UserLedger {
public:
    using Key = std::pair<PoolId, Address>;

    /// Position of `user` in `pid`; zero-valued if never touched
    UserPosition Get(PoolId pid, const Address& user) const;

    /// Mutable position, created on demand
    UserPosition& At(PoolId pid, const Address& user);

    bool Contains(PoolId pid, const Address& user) const;

    size_t Size() const { return positions_.size(); }

    void ForEach(const std::function<void(const Key&, const UserPosition&)>& fn) const;

    /// Sum of stakes recorded in a pool
    Amount TotalStaked(PoolId pid) const;

    /**
     * Reward accrued but not yet paid: stake * acc / 1e18 - debt.
     * Throws FarmError{LEDGER_INVARIANT} if debt exceeds the accrued value.
     */
    static Amount Pending(const UserPosition& position, const Amount& accRewardPerShare);

    /// Debt matching `stake` at the current accumulator
    static Amount DebtFor(const Amount& stake, const Amount& accRewardPerShare);

    bool operator==(const UserLedger& other) const { return positions_ == other.positions_; }

private:
    std::map<Key, UserPosition> positions_;
};

} // namespace farm
} // namespace daostake

#endif // DAOSTAKE_FARM_LEDGER_H
