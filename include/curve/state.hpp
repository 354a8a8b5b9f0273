// Per-token curve state and read-only snapshots
#pragma once

#include <cstdint>
#include <unordered_map>

#include "core/numeric_types.hpp"

namespace lc {
namespace curve {

// Trading -> Graduated is the only transition; nothing leaves Graduated
enum class Phase : uint8_t {
    Trading,
    Graduated,
};

inline const char* phase_name(Phase p) {
    switch (p) {
        case Phase::Trading: return "trading";
        case Phase::Graduated: return "graduated";
    }
    return "unknown";
}

struct CurveState {
    uint256_t total_raised{0};       // high-water mark of net reserve inflow, never decreases
    uint256_t current_reserves{0};   // reserve backing the curve, <= total_raised
    uint256_t units_sold{0};         // <= SELLABLE_SUPPLY
    uint256_t base_price{0};         // fixed at launch
    Phase phase{Phase::Trading};

    // Cumulative units bought per wallet; sells do not give room back
    std::unordered_map<Address, uint256_t> purchase_amounts;

    bool graduated() const { return phase == Phase::Graduated; }
};

// Summary view (price, raised, sold, graduated, progress %)
struct StateView {
    uint256_t current_price{0};
    uint256_t total_raised{0};
    uint256_t units_sold{0};
    bool graduated{false};
    uint256_t graduation_progress{0};
};

// Detailed view (price, raised, reserves, sold, graduated)
struct DetailedState {
    uint256_t current_price{0};
    uint256_t total_raised{0};
    uint256_t current_reserves{0};
    uint256_t units_sold{0};
    bool graduated{false};
};

// Outcome of an executed trade
struct TradeResult {
    uint256_t reserve_amount{0};   // buy: reserve sent in; sell: reserve paid out net of fee
    uint256_t token_amount{0};
    uint256_t fee{0};
    uint256_t new_price{0};
    bool clamped{false};
    bool graduated{false};         // this trade triggered graduation
};

} // namespace curve
} // namespace lc
