// DAOSTAKE - Farm Configuration
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Engine deployment settings read from a ConfigManager:
//
//   premint=37034997
//   [emission]
//   start_block=100
//   period_length=172800
//   period_count=24
//   base_rate=25            (whole tokens per block)
//   decay_numerator=9900
//   decay_denominator=10000
//   [wallets]
//   treasury=treasury       (40-char hex address or a label)
//   community=community
//   admin=admin
//   [pool.0]
//   lp_token=DAO-ETH
//   weight=1

#ifndef DAOSTAKE_FARM_FARM_CONFIG_H
#define DAOSTAKE_FARM_FARM_CONFIG_H

#include "daostake/core/types.h"
#include "daostake/farm/emission.h"
#include "daostake/util/config.h"
#include "daostake/util/logging.h"

#include <string>
#include <vector>

namespace daostake {
namespace farm {

struct PoolConfig {
    uint32_t index{0};
    std::string lpSymbol;   // Label the LP token is deployed under
    Address lpToken;
    Amount weight{0};
};

struct FarmConfig {
    EmissionParams emission{EmissionParams::Reference(0)};

    std::string treasuryName{"treasury"};
    std::string communityName{"community"};
    std::string adminName{"admin"};
    Address treasury;
    Address community;
    Address admin;

    /// Pools ordered by their section index
    std::vector<PoolConfig> pools;

    /// Tokens minted to the treasury before the engine takes ownership
    Amount premint{0};

    std::string dataDir;
    std::string logFile;
    util::LogLevel logLevel{util::LogLevel::Info};
    bool printToConsole{true};

    /**
     * Populate `out` from parsed configuration. Missing keys keep their
     * defaults; malformed values are reported, never thrown.
     */
    static util::ConfigParseResult FromConfig(const util::ConfigManager& config,
                                              FarmConfig& out);
};

} // namespace farm
} // namespace daostake

#endif // DAOSTAKE_FARM_FARM_CONFIG_H
