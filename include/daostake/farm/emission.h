// DAOSTAKE - Emission Schedule
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Per-block reward rates over a fixed window of equal-length periods.
// The rate of period 1 is the base rate; each later period decays by
// decayNumerator / decayDenominator, truncating.

#ifndef DAOSTAKE_FARM_EMISSION_H
#define DAOSTAKE_FARM_EMISSION_H

#include "daostake/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace daostake {
namespace farm {

// ============================================================================
// Emission Parameters
// ============================================================================

/// Blocks per period in the reference deployment
constexpr BlockNumber REFERENCE_PERIOD_LENGTH = 172800;

/// Number of periods in the reference deployment
constexpr uint32_t REFERENCE_PERIOD_COUNT = 24;

/// Reference decay of 99/100 per period
constexpr uint32_t REFERENCE_DECAY_NUMERATOR = 9900;
constexpr uint32_t REFERENCE_DECAY_DENOMINATOR = 10000;

/// Reference rate of period 1 in whole tokens per block
constexpr uint32_t REFERENCE_BASE_TOKENS_PER_BLOCK = 25;

/// Tokens pre-minted outside the engine in the reference deployment
constexpr uint64_t REFERENCE_PREMINT_TOKENS = 37034997;

struct EmissionParams {
    BlockNumber startBlock{0};
    BlockNumber periodLength{REFERENCE_PERIOD_LENGTH};
    uint32_t periodCount{REFERENCE_PERIOD_COUNT};
    Amount baseRate{0};
    uint32_t decayNumerator{REFERENCE_DECAY_NUMERATOR};
    uint32_t decayDenominator{REFERENCE_DECAY_DENOMINATOR};

    /// First block with no emission
    BlockNumber EndBlock() const {
        return startBlock + periodLength * periodCount;
    }

    /// Throws FarmError{INVALID_PARAMS} describing the first bad field
    void Validate() const;

    /// Reference deployment parameters starting at the given block
    static EmissionParams Reference(BlockNumber startBlock);

    bool operator==(const EmissionParams& other) const {
        return startBlock == other.startBlock &&
               periodLength == other.periodLength &&
               periodCount == other.periodCount &&
               baseRate == other.baseRate &&
               decayNumerator == other.decayNumerator &&
               decayDenominator == other.decayDenominator;
    }

    bool operator!=(const EmissionParams& other) const { return !(*this == other); }

    std::string ToString() const;
};

// ============================================================================
// Emission Schedule
// ============================================================================

/**
 * Immutable rate table plus the range multiplier.
 *
 * GetMultiplier(from, to) is the reward emitted over blocks [from, to)
 * for a pool holding the full weight.
 */
class EmissionSchedule {
public:
    /// Validates params and builds the rate table
    explicit EmissionSchedule(const EmissionParams& params);

    const EmissionParams& Params() const { return params_; }

    BlockNumber StartBlock() const { return params_.startBlock; }
    BlockNumber EndBlock() const { return params_.EndBlock(); }
    uint32_t PeriodCount() const { return params_.periodCount; }

    /// Per-block rate of a period in [1, P]; throws INVALID_PERIOD otherwise
    const Amount& RateOf(uint32_t period) const;

    /// 1-based period containing `block` (block >= start). May be P + 1
    /// for the end block itself.
    uint32_t PeriodOf(BlockNumber block) const;

    /// First block of a period
    BlockNumber PeriodStart(uint32_t period) const;

    /// Total emission over [from, to), clamped to the window
    Amount GetMultiplier(BlockNumber from, BlockNumber to) const;

    /// Emission over the whole window
    Amount TotalEmission() const;

    const std::vector<Amount>& Rates() const { return rates_; }

private:
    EmissionParams params_;
    std::vector<Amount> rates_;  // rates_[p - 1] is the rate of period p
};

} // namespace farm
} // namespace daostake

#endif // DAOSTAKE_FARM_EMISSION_H
