// DAOSTAKE - Emission Schedule Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/farm/emission.h"
#include "daostake/farm/errors.h"

#include <algorithm>
#include <limits>
#include <sstream>

namespace daostake {
namespace farm {

// ============================================================================
// EmissionParams
// ============================================================================

void EmissionParams::Validate() const {
    if (periodLength == 0) {
        throw FarmError(FarmErrorCode::INVALID_PARAMS, "period length must be positive");
    }
    if (periodCount == 0) {
        throw FarmError(FarmErrorCode::INVALID_PARAMS, "period count must be positive");
    }
    if (baseRate == 0) {
        throw FarmError(FarmErrorCode::INVALID_PARAMS, "base rate must be positive");
    }
    if (decayDenominator == 0) {
        throw FarmError(FarmErrorCode::INVALID_PARAMS, "decay denominator must be positive");
    }
    if (decayNumerator > decayDenominator) {
        throw FarmError(FarmErrorCode::INVALID_PARAMS, "decay must not exceed 1");
    }
    const BlockNumber maxBlock = std::numeric_limits<BlockNumber>::max();
    if (periodLength > (maxBlock - startBlock) / periodCount) {
        throw FarmError(FarmErrorCode::INVALID_PARAMS, "emission window overflows block range");
    }
}

EmissionParams EmissionParams::Reference(BlockNumber startBlock) {
    EmissionParams params;
    params.startBlock = startBlock;
    params.periodLength = REFERENCE_PERIOD_LENGTH;
    params.periodCount = REFERENCE_PERIOD_COUNT;
    params.baseRate = Amount(REFERENCE_BASE_TOKENS_PER_BLOCK) * Coin();
    params.decayNumerator = REFERENCE_DECAY_NUMERATOR;
    params.decayDenominator = REFERENCE_DECAY_DENOMINATOR;
    return params;
}

std::string EmissionParams::ToString() const {
    std::ostringstream oss;
    oss << "EmissionParams(start=" << startBlock
        << ", periodLength=" << periodLength
        << ", periods=" << periodCount
        << ", baseRate=" << FormatAmount(baseRate)
        << ", decay=" << decayNumerator << "/" << decayDenominator << ")";
    return oss.str();
}

// ============================================================================
// EmissionSchedule
// ============================================================================

EmissionSchedule::EmissionSchedule(const EmissionParams& params)
    : params_(params) {
    params_.Validate();

    rates_.reserve(params_.periodCount);
    rates_.push_back(params_.baseRate);
    for (uint32_t i = 1; i < params_.periodCount; ++i) {
        rates_.push_back(rates_.back() * params_.decayNumerator / params_.decayDenominator);
    }
}

const Amount& EmissionSchedule::RateOf(uint32_t period) const {
    if (period < 1 || period > params_.periodCount) {
        throw FarmError(FarmErrorCode::INVALID_PERIOD,
                        "period " + std::to_string(period) + " outside [1, " +
                        std::to_string(params_.periodCount) + "]");
    }
    return rates_[period - 1];
}

uint32_t EmissionSchedule::PeriodOf(BlockNumber block) const {
    if (block < params_.startBlock) {
        throw FarmError(FarmErrorCode::INVALID_PERIOD,
                        "block " + std::to_string(block) + " precedes emission start");
    }
    BlockNumber index = (block - params_.startBlock) / params_.periodLength;
    if (index >= params_.periodCount) {
        return params_.periodCount + 1;
    }
    return static_cast<uint32_t>(index) + 1;
}

BlockNumber EmissionSchedule::PeriodStart(uint32_t period) const {
    return params_.startBlock + static_cast<BlockNumber>(period - 1) * params_.periodLength;
}

Amount EmissionSchedule::GetMultiplier(BlockNumber from, BlockNumber to) const {
    from = std::max(from, params_.startBlock);
    to = std::min(to, params_.EndBlock());
    if (from >= to) {
        return 0;
    }

    const uint32_t fromPeriod = PeriodOf(from);
    const uint32_t toPeriod = PeriodOf(to);

    if (fromPeriod == toPeriod) {
        return Amount(to - from) * RateOf(toPeriod);
    }

    // Remainder of the first period
    Amount total = Amount(PeriodStart(fromPeriod + 1) - from) * RateOf(fromPeriod);

    // Partial last period; empty when `to` sits on a boundary
    BlockNumber intoLast = (to - params_.startBlock) % params_.periodLength;
    if (intoLast != 0) {
        total += Amount(intoLast) * RateOf(toPeriod);
    }

    for (uint32_t p = fromPeriod + 1; p < toPeriod; ++p) {
        total += Amount(params_.periodLength) * RateOf(p);
    }

    return total;
}

Amount EmissionSchedule::TotalEmission() const {
    return GetMultiplier(params_.startBlock, params_.EndBlock());
}

} // namespace farm
} // namespace daostake
