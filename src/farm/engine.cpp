// DAOSTAKE - Staking Engine Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/farm/engine.h"
#include "daostake/farm/arith.h"
#include "daostake/farm/errors.h"
#include "daostake/util/logging.h"

#include <algorithm>
#include <sstream>

namespace daostake {
namespace farm {

// ============================================================================
// Events
// ============================================================================

const char* FarmEventTypeToString(FarmEventType type) {
    switch (type) {
        case FarmEventType::Deposit: return "Deposit";
        case FarmEventType::Withdraw: return "Withdraw";
        case FarmEventType::EmergencyWithdraw: return "EmergencyWithdraw";
        case FarmEventType::Settle: return "Settle";
        case FarmEventType::Claim: return "Claim";
        case FarmEventType::PoolAdded: return "PoolAdded";
        case FarmEventType::PoolWeightChanged: return "PoolWeightChanged";
        case FarmEventType::WalletsChanged: return "WalletsChanged";
        case FarmEventType::RewardTokenChanged: return "RewardTokenChanged";
        case FarmEventType::AdminChanged: return "AdminChanged";
        default: return "Unknown";
    }
}

std::string FarmEvent::ToString() const {
    std::ostringstream oss;
    oss << FarmEventTypeToString(type) << "(pool=" << poolId
        << ", account=" << account.ToHex()
        << ", amount=" << FormatAmount(amount)
        << ", block=" << block << ")";
    return oss.str();
}

Amount FarmState::SumWeights() const {
    Amount sum = 0;
    for (const auto& pool : pools) {
        sum += pool.weight;
    }
    return sum;
}

// ============================================================================
// StateTransaction / ReentrancyGuard
// ============================================================================

FarmEngine::StateTransaction::StateTransaction(FarmEngine& engine, const char* operation)
    : engine_(engine), snapshot_(engine.state_), operation_(operation) {
    engine_.DiscardEvents();
}

FarmEngine::StateTransaction::~StateTransaction() {
    if (committed_) {
        return;
    }
    engine_.state_ = std::move(snapshot_);
    engine_.DiscardEvents();
    LOG_WARN(util::LogCategory::FARM) << operation_ << " failed, state rolled back";
}

void FarmEngine::StateTransaction::Commit() {
    committed_ = true;
    engine_.PublishEvents();
}

FarmEngine::ReentrancyGuard::ReentrancyGuard(bool& entered) : entered_(entered) {
    if (entered_) {
        throw FarmError(FarmErrorCode::REENTRANT_CALL, "engine re-entered during external call");
    }
    entered_ = true;
}

FarmEngine::ReentrancyGuard::~ReentrancyGuard() {
    entered_ = false;
}

// ============================================================================
// Construction
// ============================================================================

FarmEngine::FarmEngine(IChainContext& chain,
                       const Address& self,
                       const Address& admin,
                       const EmissionParams& params,
                       const Address& treasury,
                       const Address& community,
                       const Address& rewardToken)
    : chain_(chain)
    , self_(self)
    , schedule_(params)
    , accumulator_(schedule_) {
    if (self_.IsNull()) {
        throw FarmError(FarmErrorCode::INVALID_ADDRESS, "engine address is null");
    }
    if (admin.IsNull()) {
        throw FarmError(FarmErrorCode::INVALID_ADDRESS, "admin address is null");
    }
    RequireWallet(treasury, "treasury");
    RequireWallet(community, "community");
    if (!chain_.IsContract(rewardToken) || chain_.GetMintableToken(rewardToken) == nullptr) {
        throw FarmError(FarmErrorCode::INVALID_TOKEN, "reward token is not a mintable contract");
    }

    state_.admin = admin;
    state_.treasury = treasury;
    state_.community = community;
    state_.rewardToken = rewardToken;

    LOG_INFO(util::LogCategory::FARM) << "Engine " << self_.ToHex() << " created, "
                                      << schedule_.Params().ToString();
}

// ============================================================================
// Helpers
// ============================================================================

void FarmEngine::RequireAdmin(const Address& caller) const {
    if (caller != state_.admin) {
        throw FarmError(FarmErrorCode::NOT_AUTHORIZED, "caller " + caller.ToHex() + " is not admin");
    }
}

void FarmEngine::RequireWallet(const Address& wallet, const char* name) const {
    if (wallet.IsNull()) {
        throw FarmError(FarmErrorCode::INVALID_ADDRESS, std::string(name) + " wallet is null");
    }
    if (chain_.IsContract(wallet)) {
        throw FarmError(FarmErrorCode::WALLET_IS_CONTRACT,
                        std::string(name) + " wallet " + wallet.ToHex() + " is a contract");
    }
}

PoolInfo& FarmEngine::PoolAt(PoolId pid) {
    if (pid >= state_.pools.size()) {
        throw FarmError(FarmErrorCode::UNKNOWN_POOL, "pool " + std::to_string(pid));
    }
    return state_.pools[pid];
}

const PoolInfo& FarmEngine::GetPool(PoolId pid) const {
    if (pid >= state_.pools.size()) {
        throw FarmError(FarmErrorCode::UNKNOWN_POOL, "pool " + std::to_string(pid));
    }
    return state_.pools[pid];
}

IMintableToken& FarmEngine::RewardTokenContract() const {
    IMintableToken* token = chain_.GetMintableToken(state_.rewardToken);
    if (token == nullptr) {
        throw FarmError(FarmErrorCode::COLLABORATOR_FAILURE,
                        "reward token " + state_.rewardToken.ToHex() + " not found");
    }
    return *token;
}

IFungibleToken& FarmEngine::LpTokenContract(const Address& lpToken) const {
    IFungibleToken* token = chain_.GetToken(lpToken);
    if (token == nullptr) {
        throw FarmError(FarmErrorCode::COLLABORATOR_FAILURE,
                        "LP token " + lpToken.ToHex() + " not found");
    }
    return *token;
}

void FarmEngine::Mint(const Address& to, const Amount& amount) {
    if (amount == 0) {
        return;
    }
    if (!RewardTokenContract().Mint(self_, to, amount)) {
        throw FarmError(FarmErrorCode::COLLABORATOR_FAILURE,
                        "mint of " + FormatAmount(amount) + " to " + to.ToHex() + " failed");
    }
}

void FarmEngine::Emit(FarmEventType type, PoolId pid, const Address& account,
                      const Amount& amount) {
    FarmEvent event;
    event.type = type;
    event.poolId = pid;
    event.account = account;
    event.amount = amount;
    event.block = chain_.CurrentBlock();
    pendingEvents_.push_back(event);
}

void FarmEngine::PublishEvents() {
    std::vector<SettlementRecord> settlements;
    std::vector<FarmEvent> events;
    settlements.swap(pendingSettlements_);
    events.swap(pendingEvents_);

    if (settlementCallback_) {
        for (const auto& record : settlements) {
            settlementCallback_(record);
        }
    }
    if (eventCallback_) {
        for (const auto& event : events) {
            eventCallback_(event);
        }
    }
}

void FarmEngine::DiscardEvents() {
    pendingEvents_.clear();
    pendingSettlements_.clear();
}

Amount FarmEngine::LpSupply(PoolId pid) const {
    const PoolInfo& pool = GetPool(pid);
    return LpTokenContract(pool.lpToken).BalanceOf(self_);
}

Amount FarmEngine::RewardBalance() const {
    return RewardTokenContract().BalanceOf(self_);
}

// ============================================================================
// Settlement
// ============================================================================

void FarmEngine::SettlePool(PoolId pid) {
    PoolInfo& pool = PoolAt(pid);
    BlockNumber current = chain_.CurrentBlock();
    if (current <= pool.lastRewardBlock) {
        return;
    }

    Amount lpSupply = LpTokenContract(pool.lpToken).BalanceOf(self_);
    SettlementRecord record = accumulator_.Preview(pid, pool, state_.totalWeight,
                                                   lpSupply, current);

    Mint(state_.treasury, record.treasuryShare);
    Mint(state_.community, record.CommunityMint());
    Mint(self_, record.PoolMint());

    PoolAccumulator::Apply(pool, record);

    if (record.poolShareRedirected && record.poolShare > 0) {
        LOG_DEBUG(util::LogCategory::POOL) << "Pool " << pid << " has no stake, "
                                           << FormatAmount(record.poolShare)
                                           << " redirected to community";
    }
    LOG_DEBUG(util::LogCategory::POOL) << record.ToString();

    pendingSettlements_.push_back(record);
    Emit(FarmEventType::Settle, pid, self_, record.totalReward);
}

void FarmEngine::SettleAll() {
    for (PoolId pid = 0; pid < state_.pools.size(); ++pid) {
        SettlePool(pid);
    }
}

void FarmEngine::UpdatePool(PoolId pid) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "UpdatePool");
    SettlePool(pid);
    txn.Commit();
}

void FarmEngine::MassUpdatePools() {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "MassUpdatePools");
    SettleAll();
    txn.Commit();
}

Amount FarmEngine::SafeRewardTransfer(const Address& to, const Amount& amount) {
    if (amount == 0) {
        return 0;
    }

    IMintableToken& token = RewardTokenContract();
    Amount balance = token.BalanceOf(self_);
    Amount pay = std::min(amount, balance);
    if (pay < amount) {
        LOG_WARN(util::LogCategory::LEDGER) << "Reward custody short: paying "
                                            << FormatAmount(pay) << " of "
                                            << FormatAmount(amount) << " to " << to.ToHex();
    }
    if (pay == 0) {
        return 0;
    }
    if (!token.Transfer(self_, to, pay)) {
        throw FarmError(FarmErrorCode::COLLABORATOR_FAILURE,
                        "reward transfer to " + to.ToHex() + " failed");
    }
    return pay;
}

// ============================================================================
// Staking
// ============================================================================

void FarmEngine::Deposit(const Address& caller, PoolId pid, const Amount& amount) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "Deposit");

    SettlePool(pid);
    const Amount acc = PoolAt(pid).accRewardPerShare;
    const Address lpToken = PoolAt(pid).lpToken;

    UserPosition& position = state_.ledger.At(pid, caller);
    if (position.IsStaked()) {
        Amount pending = UserLedger::Pending(position, acc);
        position.rewardDebt = UserLedger::DebtFor(position.stakeAmount, acc);
        Amount paid = SafeRewardTransfer(caller, pending);
        if (paid > 0) {
            Emit(FarmEventType::Claim, pid, caller, paid);
        }
    }

    if (amount > 0) {
        if (!LpTokenContract(lpToken).TransferFrom(self_, caller, self_, amount)) {
            throw FarmError(FarmErrorCode::COLLABORATOR_FAILURE,
                            "LP transfer from " + caller.ToHex() + " failed");
        }
        position.stakeAmount += amount;
    }
    position.rewardDebt = UserLedger::DebtFor(position.stakeAmount, acc);

    Emit(FarmEventType::Deposit, pid, caller, amount);
    LOG_INFO(util::LogCategory::LEDGER) << "Deposit pool=" << pid << " user=" << caller.ToHex()
                                        << " amount=" << FormatAmount(amount)
                                        << " stake=" << FormatAmount(position.stakeAmount);
    txn.Commit();
}

void FarmEngine::Withdraw(const Address& caller, PoolId pid, const Amount& amount) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "Withdraw");

    GetPool(pid);
    UserPosition before = state_.ledger.Get(pid, caller);
    if (amount > before.stakeAmount) {
        throw FarmError(FarmErrorCode::INSUFFICIENT_BALANCE,
                        "withdraw " + FormatAmount(amount) + " exceeds stake " +
                        FormatAmount(before.stakeAmount));
    }

    SettlePool(pid);
    const Amount acc = PoolAt(pid).accRewardPerShare;
    const Address lpToken = PoolAt(pid).lpToken;

    Amount pending = 0;
    Amount remaining = 0;
    if (state_.ledger.Contains(pid, caller)) {
        UserPosition& position = state_.ledger.At(pid, caller);
        pending = UserLedger::Pending(position, acc);
        position.stakeAmount -= amount;
        position.rewardDebt = UserLedger::DebtFor(position.stakeAmount, acc);
        remaining = position.stakeAmount;
    }

    Amount paid = SafeRewardTransfer(caller, pending);
    if (paid > 0) {
        Emit(FarmEventType::Claim, pid, caller, paid);
    }

    if (amount > 0) {
        if (!LpTokenContract(lpToken).Transfer(self_, caller, amount)) {
            throw FarmError(FarmErrorCode::COLLABORATOR_FAILURE,
                            "LP transfer to " + caller.ToHex() + " failed");
        }
    }

    Emit(FarmEventType::Withdraw, pid, caller, amount);
    LOG_INFO(util::LogCategory::LEDGER) << "Withdraw pool=" << pid << " user=" << caller.ToHex()
                                        << " amount=" << FormatAmount(amount)
                                        << " stake=" << FormatAmount(remaining);
    txn.Commit();
}

void FarmEngine::EmergencyWithdraw(const Address& caller, PoolId pid) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "EmergencyWithdraw");

    const PoolInfo pool = GetPool(pid);

    // Position is closed before the token call can observe it
    Amount amount = 0;
    if (state_.ledger.Contains(pid, caller)) {
        UserPosition& position = state_.ledger.At(pid, caller);
        amount = position.stakeAmount;
        position.stakeAmount = 0;
        position.rewardDebt = 0;
    }

    if (amount > 0 && !LpTokenContract(pool.lpToken).Transfer(self_, caller, amount)) {
        throw FarmError(FarmErrorCode::COLLABORATOR_FAILURE,
                        "LP transfer to " + caller.ToHex() + " failed");
    }

    Emit(FarmEventType::EmergencyWithdraw, pid, caller, amount);
    LOG_INFO(util::LogCategory::LEDGER) << "EmergencyWithdraw pool=" << pid
                                        << " user=" << caller.ToHex()
                                        << " amount=" << FormatAmount(amount);
    txn.Commit();
}

// ============================================================================
// Queries
// ============================================================================

Amount FarmEngine::PendingReward(PoolId pid, const Address& user) const {
    const PoolInfo& pool = GetPool(pid);
    Amount lpSupply = LpTokenContract(pool.lpToken).BalanceOf(self_);
    SettlementRecord preview = accumulator_.Preview(pid, pool, state_.totalWeight, lpSupply,
                                                    chain_.CurrentBlock());
    return UserLedger::Pending(state_.ledger.Get(pid, user), preview.accRewardPerShare);
}

UserPosition FarmEngine::GetPosition(PoolId pid, const Address& user) const {
    GetPool(pid);
    return state_.ledger.Get(pid, user);
}

// ============================================================================
// Admin Operations
// ============================================================================

void FarmEngine::SetWallets(const Address& caller, const Address& treasury,
                            const Address& community) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "SetWallets");
    RequireAdmin(caller);
    RequireWallet(treasury, "treasury");
    RequireWallet(community, "community");

    state_.treasury = treasury;
    state_.community = community;

    Emit(FarmEventType::WalletsChanged, 0, treasury, 0);
    LOG_INFO(util::LogCategory::ADMIN) << "Wallets set: treasury=" << treasury.ToHex()
                                       << " community=" << community.ToHex();
    txn.Commit();
}

void FarmEngine::SetRewardToken(const Address& caller, const Address& token) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "SetRewardToken");
    RequireAdmin(caller);
    if (!chain_.IsContract(token) || chain_.GetMintableToken(token) == nullptr) {
        throw FarmError(FarmErrorCode::INVALID_TOKEN, "reward token is not a mintable contract");
    }
    for (const auto& pool : state_.pools) {
        if (pool.lpToken == token) {
            throw FarmError(FarmErrorCode::INVALID_TOKEN, "reward token " + token.ToHex() +
                            " is staked in a pool");
        }
    }

    state_.rewardToken = token;

    Emit(FarmEventType::RewardTokenChanged, 0, token, 0);
    LOG_INFO(util::LogCategory::ADMIN) << "Reward token set to " << token.ToHex();
    txn.Commit();
}

PoolId FarmEngine::AddPool(const Address& caller, const Amount& weight,
                           const Address& lpToken, bool withUpdate) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "AddPool");
    RequireAdmin(caller);

    if (!chain_.IsContract(lpToken) || chain_.GetToken(lpToken) == nullptr) {
        throw FarmError(FarmErrorCode::INVALID_TOKEN, "LP token " + lpToken.ToHex() +
                        " is not a token contract");
    }
    // Custody of the reward token is not stake
    if (lpToken == state_.rewardToken) {
        throw FarmError(FarmErrorCode::INVALID_TOKEN, "LP token " + lpToken.ToHex() +
                        " is the reward token");
    }
    for (const auto& pool : state_.pools) {
        if (pool.lpToken == lpToken) {
            throw FarmError(FarmErrorCode::DUPLICATE_POOL, "LP token " + lpToken.ToHex() +
                            " already has a pool");
        }
    }
    BlockNumber current = chain_.CurrentBlock();
    if (current >= schedule_.EndBlock()) {
        throw FarmError(FarmErrorCode::EMISSION_ENDED, "emission ended at block " +
                        std::to_string(schedule_.EndBlock()));
    }

    if (withUpdate) {
        SettleAll();
    }

    PoolInfo pool;
    pool.lpToken = lpToken;
    pool.weight = weight;
    pool.lastRewardBlock = std::max(current, schedule_.StartBlock());
    pool.accRewardPerShare = 0;

    state_.totalWeight += weight;
    state_.pools.push_back(pool);
    PoolId pid = static_cast<PoolId>(state_.pools.size() - 1);

    Emit(FarmEventType::PoolAdded, pid, lpToken, weight);
    LOG_INFO(util::LogCategory::ADMIN) << "Pool " << pid << " added: lp=" << lpToken.ToHex()
                                       << " weight=" << weight.str()
                                       << " totalWeight=" << state_.totalWeight.str();
    txn.Commit();
    return pid;
}

void FarmEngine::SetPoolWeight(const Address& caller, PoolId pid, const Amount& weight,
                               bool withUpdate) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "SetPoolWeight");
    RequireAdmin(caller);
    GetPool(pid);

    if (withUpdate) {
        SettleAll();
    }

    PoolInfo& pool = PoolAt(pid);
    state_.totalWeight = state_.totalWeight - pool.weight + weight;
    pool.weight = weight;

    Emit(FarmEventType::PoolWeightChanged, pid, pool.lpToken, weight);
    LOG_INFO(util::LogCategory::ADMIN) << "Pool " << pid << " weight=" << weight.str()
                                       << " totalWeight=" << state_.totalWeight.str();
    txn.Commit();
}

void FarmEngine::TransferRewardTokenOwnership(const Address& caller, const Address& newOwner) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "TransferRewardTokenOwnership");
    RequireAdmin(caller);
    if (newOwner.IsNull()) {
        throw FarmError(FarmErrorCode::INVALID_ADDRESS, "new owner is null");
    }

    if (!RewardTokenContract().TransferOwnership(self_, newOwner)) {
        throw FarmError(FarmErrorCode::COLLABORATOR_FAILURE, "reward token ownership transfer failed");
    }

    LOG_WARN(util::LogCategory::ADMIN) << "Reward token ownership moved to " << newOwner.ToHex()
                                       << ", engine can no longer mint";
    txn.Commit();
}

void FarmEngine::TransferAdmin(const Address& caller, const Address& newAdmin) {
    ReentrancyGuard guard(entered_);
    StateTransaction txn(*this, "TransferAdmin");
    RequireAdmin(caller);
    if (newAdmin.IsNull()) {
        throw FarmError(FarmErrorCode::INVALID_ADDRESS, "new admin is null");
    }

    state_.admin = newAdmin;

    Emit(FarmEventType::AdminChanged, 0, newAdmin, 0);
    LOG_INFO(util::LogCategory::ADMIN) << "Admin transferred to " << newAdmin.ToHex();
    txn.Commit();
}

void FarmEngine::ReplaceState(const FarmState& state) {
    ReentrancyGuard guard(entered_);

    if (state.totalWeight != state.SumWeights()) {
        throw FarmError(FarmErrorCode::LEDGER_INVARIANT,
                        "total weight " + state.totalWeight.str() +
                        " does not match pool weights " + state.SumWeights().str());
    }
    if (state.admin.IsNull() || state.treasury.IsNull() || state.community.IsNull()) {
        throw FarmError(FarmErrorCode::INVALID_ADDRESS, "persisted state has null addresses");
    }
    for (size_t i = 0; i < state.pools.size(); ++i) {
        for (size_t j = i + 1; j < state.pools.size(); ++j) {
            if (state.pools[i].lpToken == state.pools[j].lpToken) {
                throw FarmError(FarmErrorCode::DUPLICATE_POOL, "persisted pools share an LP token");
            }
        }
        if (state.pools[i].lpToken == state.rewardToken) {
            throw FarmError(FarmErrorCode::INVALID_TOKEN, "persisted pool stakes the reward token");
        }
    }
    bool badPosition = false;
    state.ledger.ForEach([&](const UserLedger::Key& key, const UserPosition&) {
        if (key.first >= state.pools.size()) {
            badPosition = true;
        }
    });
    if (badPosition) {
        throw FarmError(FarmErrorCode::UNKNOWN_POOL, "persisted position refers to missing pool");
    }

    state_ = state;
    DiscardEvents();
    LOG_INFO(util::LogCategory::FARM) << "State replaced: " << state_.pools.size() << " pools, "
                                      << state_.ledger.Size() << " positions";
}

} // namespace farm
} // namespace daostake
