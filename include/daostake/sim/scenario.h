// DAOSTAKE - Scenario Runner
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Deploys an engine on a LocalChain from a FarmConfig and drives it with
// a line-oriented script:
//
//   block N                      jump to block N
//   advance N                    move N blocks forward
//   fund <who> <pid> <amount>    mint LP tokens to <who> and approve the engine
//   deposit <who> <pid> <amount>
//   withdraw <who> <pid> <amount>
//   emergency <who> <pid>
//   pending <who> <pid>
//   update <pid>
//   massupdate
//   setweight <pid> <weight>
//   balance <who>
//
// Blank lines and lines starting with # are ignored.

#ifndef DAOSTAKE_SIM_SCENARIO_H
#define DAOSTAKE_SIM_SCENARIO_H

#include "daostake/core/types.h"
#include "daostake/farm/engine.h"
#include "daostake/farm/farm_config.h"
#include "daostake/host/local_chain.h"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace daostake {
namespace sim {

/// Label of the engine's own address
constexpr const char* ENGINE_LABEL = "daostake-engine";

/// Symbol of the reward token
constexpr const char* REWARD_SYMBOL = "DAO";

struct CommandResult {
    bool ok{true};
    bool skipped{false};   // Blank or comment line
    std::string output;
};

class Scenario {
public:
    /// Deploy tokens, the engine and every configured pool. Log entries
    /// are stamped with this scenario's block until it is destroyed.
    explicit Scenario(const farm::FarmConfig& config);
    ~Scenario();

    Scenario(const Scenario&) = delete;
    Scenario& operator=(const Scenario&) = delete;

    /// Run one script line. Engine failures become ok=false results.
    CommandResult Execute(const std::string& line);

    /// Run a whole script, one output line per command. Returns the
    /// number of failed commands.
    size_t Run(std::istream& in, std::ostream& out);

    host::LocalChain& Chain() { return chain_; }
    farm::FarmEngine& Engine() { return *engine_; }
    host::MemoryToken& RewardToken() { return *rewardToken_; }

    /// LP token of a pool
    host::MemoryToken& LpToken(PoolId pid);

    const farm::FarmConfig& Config() const { return config_; }

    /// Address of a script participant
    static Address AccountOf(const std::string& name);

private:
    CommandResult Dispatch(const std::vector<std::string>& args);

    Amount ParseTokens(const std::string& text) const;
    PoolId ParsePool(const std::string& text) const;
    BlockNumber ParseBlock(const std::string& text) const;

    farm::FarmConfig config_;
    host::LocalChain chain_;
    host::MemoryToken* rewardToken_{nullptr};
    std::unique_ptr<farm::FarmEngine> engine_;
};

} // namespace sim
} // namespace daostake

#endif // DAOSTAKE_SIM_SCENARIO_H
