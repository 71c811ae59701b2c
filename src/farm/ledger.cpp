// DAOSTAKE - User Ledger Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/farm/ledger.h"
#include "daostake/farm/arith.h"
#include "daostake/farm/errors.h"

namespace daostake {
namespace farm {

UserPosition UserLedger::Get(PoolId pid, const Address& user) const {
    auto it = positions_.find(Key(pid, user));
    if (it == positions_.end()) {
        return UserPosition();
    }
    return it->second;
}

UserPosition& UserLedger::At(PoolId pid, const Address& user) {
    return positions_[Key(pid, user)];
}

bool UserLedger::Contains(PoolId pid, const Address& user) const {
    return positions_.find(Key(pid, user)) != positions_.end();
}

void UserLedger::ForEach(const std::function<void(const Key&, const UserPosition&)>& fn) const {
    for (const auto& [key, position] : positions_) {
        fn(key, position);
    }
}

Amount UserLedger::TotalStaked(PoolId pid) const {
    Amount total = 0;
    auto it = positions_.lower_bound(Key(pid, Address()));
    for (; it != positions_.end() && it->first.first == pid; ++it) {
        total += it->second.stakeAmount;
    }
    return total;
}

Amount UserLedger::Pending(const UserPosition& position, const Amount& accRewardPerShare) {
    Amount accrued = AccruedReward(position.stakeAmount, accRewardPerShare);
    if (accrued < position.rewardDebt) {
        throw FarmError(FarmErrorCode::LEDGER_INVARIANT,
                        "reward debt " + position.rewardDebt.str() +
                        " exceeds accrued " + accrued.str());
    }
    return accrued - position.rewardDebt;
}

Amount UserLedger::DebtFor(const Amount& stake, const Amount& accRewardPerShare) {
    return AccruedReward(stake, accRewardPerShare);
}

} // namespace farm
} // namespace daostake
