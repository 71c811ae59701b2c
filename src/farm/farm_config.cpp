// DAOSTAKE - Farm Configuration Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/farm/farm_config.h"
#include "daostake/crypto/hash.h"
#include "daostake/farm/errors.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace daostake {
namespace farm {

namespace {

using util::ConfigKeys::SECTION_EMISSION;
using util::ConfigKeys::SECTION_WALLETS;

/// Reads an optional unsigned key; false if present but malformed
bool ReadUInt(const util::ConfigManager& config, const char* key, const std::string& section,
              uint64_t max, uint64_t& out, std::string& error) {
    if (!config.HasKey(key, section)) {
        return true;
    }
    auto value = config.TryGetUInt(key, section);
    if (!value || *value > max) {
        error = "invalid " + (section.empty() ? "" : section + ".") + key + ": " +
                config.GetString(key, "", section);
        return false;
    }
    out = *value;
    return true;
}

/// Reads an optional decimal amount with the given decimals
bool ReadAmount(const util::ConfigManager& config, const char* key, const std::string& section,
                int decimals, Amount& out, std::string& error) {
    auto text = config.TryGetString(key, section);
    if (!text) {
        return true;
    }
    auto value = ParseAmount(*text, decimals);
    if (!value) {
        error = "invalid " + (section.empty() ? "" : section + ".") + key + ": " + *text;
        return false;
    }
    out = *value;
    return true;
}

} // anonymous namespace

util::ConfigParseResult FarmConfig::FromConfig(const util::ConfigManager& config,
                                               FarmConfig& out) {
    namespace keys = util::ConfigKeys;
    std::string error;

    // [emission]
    EmissionParams& em = out.emission;
    uint64_t value = em.startBlock;
    if (!ReadUInt(config, keys::START_BLOCK, SECTION_EMISSION,
                  std::numeric_limits<uint64_t>::max(), value, error)) {
        return util::ConfigParseResult::Error(error);
    }
    em.startBlock = value;

    value = em.periodLength;
    if (!ReadUInt(config, keys::PERIOD_LENGTH, SECTION_EMISSION,
                  std::numeric_limits<uint64_t>::max(), value, error)) {
        return util::ConfigParseResult::Error(error);
    }
    em.periodLength = value;

    const uint64_t max32 = std::numeric_limits<uint32_t>::max();
    value = em.periodCount;
    if (!ReadUInt(config, keys::PERIOD_COUNT, SECTION_EMISSION, max32, value, error)) {
        return util::ConfigParseResult::Error(error);
    }
    em.periodCount = static_cast<uint32_t>(value);

    value = em.decayNumerator;
    if (!ReadUInt(config, keys::DECAY_NUMERATOR, SECTION_EMISSION, max32, value, error)) {
        return util::ConfigParseResult::Error(error);
    }
    em.decayNumerator = static_cast<uint32_t>(value);

    value = em.decayDenominator;
    if (!ReadUInt(config, keys::DECAY_DENOMINATOR, SECTION_EMISSION, max32, value, error)) {
        return util::ConfigParseResult::Error(error);
    }
    em.decayDenominator = static_cast<uint32_t>(value);

    if (!ReadAmount(config, keys::BASE_RATE, SECTION_EMISSION, TOKEN_DECIMALS,
                    em.baseRate, error)) {
        return util::ConfigParseResult::Error(error);
    }

    try {
        em.Validate();
    } catch (const FarmError& e) {
        return util::ConfigParseResult::Error(e.what());
    }

    // Globals
    if (!ReadAmount(config, keys::PREMINT, "", TOKEN_DECIMALS, out.premint, error)) {
        return util::ConfigParseResult::Error(error);
    }
    out.dataDir = config.GetString(keys::DATADIR, out.dataDir);
    out.logFile = config.GetString(keys::LOGFILE, out.logFile);
    out.logLevel = util::LogLevelFromString(
        config.GetString(keys::LOGLEVEL, util::LogLevelToString(out.logLevel)));
    out.printToConsole = config.GetBool(keys::PRINTTOCONSOLE, out.printToConsole);

    // [wallets]
    out.treasuryName = config.GetString(keys::TREASURY, out.treasuryName, SECTION_WALLETS);
    out.communityName = config.GetString(keys::COMMUNITY, out.communityName, SECTION_WALLETS);
    out.adminName = config.GetString(keys::ADMIN, out.adminName, SECTION_WALLETS);
    out.treasury = crypto::ResolveAddress(out.treasuryName);
    out.community = crypto::ResolveAddress(out.communityName);
    out.admin = crypto::ResolveAddress(out.adminName);
    if (out.treasury == out.community) {
        return util::ConfigParseResult::Error("treasury and community wallets must differ");
    }

    // [pool.N]
    out.pools.clear();
    const std::string poolPrefix = keys::SECTION_POOL_PREFIX;
    for (const auto& section : config.GetSections()) {
        if (section.compare(0, poolPrefix.size(), poolPrefix) != 0) {
            continue;
        }
        std::string indexText = section.substr(poolPrefix.size());
        if (indexText.empty() ||
            !std::all_of(indexText.begin(), indexText.end(), ::isdigit) ||
            indexText.size() > 9) {
            return util::ConfigParseResult::Error("invalid pool section [" + section + "]");
        }

        PoolConfig pool;
        pool.index = static_cast<uint32_t>(std::stoul(indexText));

        auto lp = config.TryGetString(keys::LP_TOKEN, section);
        if (!lp || lp->empty()) {
            return util::ConfigParseResult::Error("[" + section + "] missing lp_token");
        }
        pool.lpSymbol = *lp;
        pool.lpToken = crypto::ResolveAddress(*lp);

        pool.weight = 1;
        if (!ReadAmount(config, keys::WEIGHT, section, 0, pool.weight, error)) {
            return util::ConfigParseResult::Error(error);
        }
        out.pools.push_back(pool);
    }

    std::sort(out.pools.begin(), out.pools.end(),
              [](const PoolConfig& a, const PoolConfig& b) { return a.index < b.index; });
    for (size_t i = 0; i < out.pools.size(); ++i) {
        for (size_t j = i + 1; j < out.pools.size(); ++j) {
            if (out.pools[i].lpToken == out.pools[j].lpToken) {
                return util::ConfigParseResult::Error("duplicate lp_token " +
                                                      out.pools[j].lpSymbol);
            }
        }
    }

    return util::ConfigParseResult::Success();
}

} // namespace farm
} // namespace daostake
