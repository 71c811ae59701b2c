// DAOSTAKE - Scenario Runner Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/sim/scenario.h"
#include "daostake/crypto/hash.h"
#include "daostake/farm/errors.h"
#include "daostake/util/logging.h"

#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace daostake {
namespace sim {

namespace {

std::vector<std::string> Tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

void RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() != count) {
        throw std::invalid_argument(std::string("usage: ") + usage);
    }
}

} // anonymous namespace

// ============================================================================
// Setup
// ============================================================================

Address Scenario::AccountOf(const std::string& name) {
    return crypto::ResolveAddress(name);
}

Scenario::Scenario(const farm::FarmConfig& config)
    : config_(config), chain_(0) {
    const Address engineAddress = AccountOf(ENGINE_LABEL);
    chain_.RegisterContract(engineAddress);

    rewardToken_ = &chain_.CreateToken(REWARD_SYMBOL, config_.admin);
    if (config_.premint > 0 &&
        !rewardToken_->Mint(config_.admin, config_.treasury, config_.premint)) {
        throw farm::FarmError(farm::FarmErrorCode::COLLABORATOR_FAILURE, "premint failed");
    }
    if (!rewardToken_->TransferOwnership(config_.admin, engineAddress)) {
        throw farm::FarmError(farm::FarmErrorCode::COLLABORATOR_FAILURE,
                              "reward token ownership transfer failed");
    }

    engine_ = std::make_unique<farm::FarmEngine>(chain_, engineAddress, config_.admin,
                                                 config_.emission, config_.treasury,
                                                 config_.community,
                                                 rewardToken_->GetAddress());

    for (const auto& pool : config_.pools) {
        chain_.CreateToken(pool.lpSymbol, pool.lpToken, config_.admin);
        PoolId pid = engine_->AddPool(config_.admin, pool.weight, pool.lpToken, false);
        LOG_INFO(util::LogCategory::SIM) << "Pool " << pid << " (" << pool.lpSymbol
                                         << ") weight " << pool.weight.str();
    }

    // Set last: a throwing constructor never reaches ~Scenario
    util::Logger::Instance().SetBlockSource([this] { return chain_.CurrentBlock(); });
}

Scenario::~Scenario() {
    util::Logger::Instance().ClearBlockSource();
}

host::MemoryToken& Scenario::LpToken(PoolId pid) {
    host::MemoryToken* token = chain_.FindToken(engine_->GetPool(pid).lpToken);
    if (token == nullptr) {
        throw farm::FarmError(farm::FarmErrorCode::UNKNOWN_POOL,
                              "no LP token for pool " + std::to_string(pid));
    }
    return *token;
}

// ============================================================================
// Argument Parsing
// ============================================================================

Amount Scenario::ParseTokens(const std::string& text) const {
    auto amount = ParseAmount(text);
    if (!amount) {
        throw std::invalid_argument("bad amount: " + text);
    }
    return *amount;
}

PoolId Scenario::ParsePool(const std::string& text) const {
    auto value = ParseAmount(text, 0);
    if (!value || *value >= engine_->PoolLength()) {
        throw farm::FarmError(farm::FarmErrorCode::UNKNOWN_POOL, "pool " + text);
    }
    return value->convert_to<PoolId>();
}

BlockNumber Scenario::ParseBlock(const std::string& text) const {
    auto value = ParseAmount(text, 0);
    if (!value || *value > std::numeric_limits<BlockNumber>::max()) {
        throw std::invalid_argument("bad block number: " + text);
    }
    return value->convert_to<BlockNumber>();
}

// ============================================================================
// Commands
// ============================================================================

CommandResult Scenario::Dispatch(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    std::ostringstream out;
    farm::FarmEngine& engine = *engine_;

    if (cmd == "block") {
        RequireArgs(args, 2, "block <n>");
        BlockNumber block = ParseBlock(args[1]);
        if (!chain_.SetBlock(block)) {
            throw std::invalid_argument("cannot move back to block " + args[1]);
        }
        out << "block " << chain_.CurrentBlock();
    } else if (cmd == "advance") {
        RequireArgs(args, 2, "advance <n>");
        if (!chain_.AdvanceBlocks(ParseBlock(args[1]))) {
            throw std::invalid_argument("cannot advance " + args[1] + " blocks from block " +
                                        std::to_string(chain_.CurrentBlock()));
        }
        out << "block " << chain_.CurrentBlock();
    } else if (cmd == "fund") {
        RequireArgs(args, 4, "fund <who> <pid> <amount>");
        Address who = AccountOf(args[1]);
        PoolId pid = ParsePool(args[2]);
        Amount amount = ParseTokens(args[3]);
        host::MemoryToken& lp = LpToken(pid);
        chain_.Execute([&] {
            if (!lp.Mint(config_.admin, who, amount) ||
                !lp.Approve(who, engine.Self(), lp.Allowance(who, engine.Self()) + amount)) {
                throw farm::FarmError(farm::FarmErrorCode::COLLABORATOR_FAILURE,
                                      "funding " + args[1] + " failed");
            }
        });
        out << "fund " << args[1] << " pool=" << pid << " amount=" << FormatAmount(amount);
    } else if (cmd == "deposit" || cmd == "withdraw") {
        RequireArgs(args, 4, "deposit|withdraw <who> <pid> <amount>");
        Address who = AccountOf(args[1]);
        PoolId pid = ParsePool(args[2]);
        Amount amount = ParseTokens(args[3]);
        chain_.Execute([&] {
            if (cmd == "deposit") {
                engine.Deposit(who, pid, amount);
            } else {
                engine.Withdraw(who, pid, amount);
            }
        });
        out << cmd << " " << args[1] << " pool=" << pid << " amount=" << FormatAmount(amount)
            << " stake=" << FormatAmount(engine.GetPosition(pid, who).stakeAmount)
            << " reward=" << FormatAmount(rewardToken_->BalanceOf(who));
    } else if (cmd == "emergency") {
        RequireArgs(args, 3, "emergency <who> <pid>");
        Address who = AccountOf(args[1]);
        PoolId pid = ParsePool(args[2]);
        Amount before = LpToken(pid).BalanceOf(who);
        chain_.Execute([&] { engine.EmergencyWithdraw(who, pid); });
        out << "emergency " << args[1] << " pool=" << pid << " returned="
            << FormatAmount(LpToken(pid).BalanceOf(who) - before);
    } else if (cmd == "pending") {
        RequireArgs(args, 3, "pending <who> <pid>");
        Address who = AccountOf(args[1]);
        PoolId pid = ParsePool(args[2]);
        out << "pending " << args[1] << " pool=" << pid << " reward="
            << FormatAmount(engine.PendingReward(pid, who));
    } else if (cmd == "update") {
        RequireArgs(args, 2, "update <pid>");
        PoolId pid = ParsePool(args[1]);
        chain_.Execute([&] { engine.UpdatePool(pid); });
        const farm::PoolInfo& pool = engine.GetPool(pid);
        out << "update pool=" << pid << " lastRewardBlock=" << pool.lastRewardBlock
            << " acc=" << pool.accRewardPerShare.str();
    } else if (cmd == "massupdate") {
        RequireArgs(args, 1, "massupdate");
        chain_.Execute([&] { engine.MassUpdatePools(); });
        out << "massupdate pools=" << engine.PoolLength();
    } else if (cmd == "setweight") {
        RequireArgs(args, 3, "setweight <pid> <weight>");
        PoolId pid = ParsePool(args[1]);
        auto weight = ParseAmount(args[2], 0);
        if (!weight) {
            throw std::invalid_argument("bad weight: " + args[2]);
        }
        chain_.Execute([&] { engine.SetPoolWeight(config_.admin, pid, *weight, true); });
        out << "setweight pool=" << pid << " weight=" << weight->str()
            << " total=" << engine.TotalWeight().str();
    } else if (cmd == "balance") {
        RequireArgs(args, 2, "balance <who>");
        Address who = AccountOf(args[1]);
        out << "balance " << args[1] << " " << REWARD_SYMBOL << "="
            << FormatAmount(rewardToken_->BalanceOf(who));
        for (PoolId pid = 0; pid < engine.PoolLength(); ++pid) {
            host::MemoryToken& lp = LpToken(pid);
            out << " " << lp.Symbol() << "=" << FormatAmount(lp.BalanceOf(who));
        }
    } else {
        throw std::invalid_argument("unknown command: " + cmd);
    }

    CommandResult result;
    result.output = out.str();
    return result;
}

CommandResult Scenario::Execute(const std::string& line) {
    std::vector<std::string> args = Tokenize(line);
    CommandResult result;
    if (args.empty() || args[0][0] == '#') {
        result.skipped = true;
        return result;
    }

    try {
        return Dispatch(args);
    } catch (const farm::FarmError& e) {
        result.ok = false;
        result.output = std::string("error: ") + e.what();
    } catch (const std::invalid_argument& e) {
        result.ok = false;
        result.output = std::string("error: ") + e.what();
    } catch (const std::runtime_error& e) {
        // Checked arithmetic overflow inside the engine
        result.ok = false;
        result.output = std::string("error: arithmetic: ") + e.what();
    }
    LOG_DEBUG(util::LogCategory::SIM) << "'" << line << "' -> " << result.output;
    return result;
}

size_t Scenario::Run(std::istream& in, std::ostream& out) {
    size_t failures = 0;
    std::string line;
    while (std::getline(in, line)) {
        CommandResult result = Execute(line);
        if (result.skipped) {
            continue;
        }
        if (!result.ok) {
            ++failures;
        }
        out << result.output << "\n";
    }
    return failures;
}

} // namespace sim
} // namespace daostake
