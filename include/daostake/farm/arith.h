// DAOSTAKE - Fixed-Point Reward Arithmetic
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// All arithmetic is on checked 256-bit integers. Divisions truncate
// toward zero; the resulting under-payment is bounded and never
// corrected afterwards.

#ifndef DAOSTAKE_FARM_ARITH_H
#define DAOSTAKE_FARM_ARITH_H

#include "daostake/core/types.h"

#include <cstdint>

namespace daostake {
namespace farm {

// ============================================================================
// Split Percentages
// ============================================================================

/// Share of each settlement minted to the treasury wallet
constexpr uint32_t TREASURY_PERCENT = 15;

/// Share of each settlement minted to the community wallet
constexpr uint32_t COMMUNITY_PERCENT = 15;

/// Share of each settlement minted to stakers of the pool
constexpr uint32_t POOL_PERCENT = 30;

/// The remaining 40% is pre-minted outside the engine
constexpr uint32_t PREMINT_PERCENT = 100 - TREASURY_PERCENT - COMMUNITY_PERCENT - POOL_PERCENT;

// ============================================================================
// Helpers
// ============================================================================

/// Scale factor of accRewardPerShare (10^18)
inline Amount AccPrecision() {
    return PowerOfTen(18);
}

/// a * b / d, truncating. Throws on overflow or d == 0.
inline Amount MulDiv(const Amount& a, const Amount& b, const Amount& d) {
    return (a * b) / d;
}

/// total * percent / 100, truncating
inline Amount Percentage(const Amount& total, uint32_t percent) {
    return (total * percent) / 100;
}

/// Reward accrued by `stake` at accumulator value `acc`
inline Amount AccruedReward(const Amount& stake, const Amount& acc) {
    return MulDiv(stake, acc, AccPrecision());
}

} // namespace farm
} // namespace daostake

#endif // DAOSTAKE_FARM_ARITH_H
