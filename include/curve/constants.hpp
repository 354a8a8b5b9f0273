// Launch economics: supply split, fee schedule, graduation threshold
#pragma once

#include "core/numeric_types.hpp"

namespace lc {
namespace curve {

inline const char* version() { return "2.2.0-comprehensive-fixes"; }

// 1e18 fixed-point scale shared by amounts, prices and progress
inline const uint256_t& WAD() {
    static const uint256_t v("1000000000000000000");
    return v;
}

// Total issuance: 1,000,000,000 tokens
inline const uint256_t& TOTAL_SUPPLY() {
    static const uint256_t v = uint256_t(1000000000) * WAD();
    return v;
}

// 80% of issuance is distributed through the curve
inline const uint256_t& SELLABLE_SUPPLY() {
    static const uint256_t v = TOTAL_SUPPLY() * 80 / 100;
    return v;
}

// Fixed graduation threshold (116,589 reserve units), not oracle-derived
inline const uint256_t& GRADUATION_THRESHOLD() {
    static const uint256_t v = uint256_t(116589) * WAD();
    return v;
}

// Largest accepted base price. Keeps base * (S+x)^3 inside 512 bits
// for the whole curve (x <= S, (2S)^3 < 2^272).
inline const uint256_t& MAX_BASE_PRICE() {
    static const uint256_t v = uint256_t(1) << 128;
    return v;
}

constexpr unsigned BASIS_POINTS = 10000;
constexpr unsigned PLATFORM_FEE_BPS = 100;   // 1%
constexpr unsigned MAX_PURCHASE_BPS = 400;   // 4% of TOTAL_SUPPLY, not of SELLABLE_SUPPLY

// Per-wallet cumulative purchase cap
inline const uint256_t& MAX_PURCHASE() {
    static const uint256_t v = TOTAL_SUPPLY() * MAX_PURCHASE_BPS / BASIS_POINTS;
    return v;
}

// Graduation split in percent; treasury takes the remainder
constexpr unsigned LIQUIDITY_PCT = 50;
constexpr unsigned CREATOR_PCT = 30;
constexpr unsigned TREASURY_PCT = 20;

static_assert(LIQUIDITY_PCT + CREATOR_PCT + TREASURY_PCT == 100, "graduation split must cover 100%");

} // namespace curve
} // namespace lc
