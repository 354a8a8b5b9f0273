// Bonding curve market maker for one launched token
#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "core/numeric_types.hpp"
#include "curve/constants.hpp"
#include "curve/curve_math.hpp"
#include "curve/errors.hpp"
#include "curve/reentrancy.hpp"
#include "curve/state.hpp"
#include "curve/transaction.hpp"
#include "events/sink.hpp"
#include "ledger/interfaces.hpp"

namespace lc {
namespace curve {

// Launch-time identity and parameters of a curve
struct CurveConfig {
    Address curve;      // the curve's own account on both ledgers
    Address token;
    Address creator;
    Address treasury;
    Address owner;      // may pause/unpause
    uint256_t base_price{0};
};

// Throws std::invalid_argument on an unusable configuration
void validate(const CurveConfig& cfg);

class BondingCurve {
public:
    using Math = CurveMath<uint256_t>;

    // The curve must already hold the issued supply on the token ledger.
    // sink and liquidity are optional; without a sink notifications are dropped.
    BondingCurve(const CurveConfig& cfg,
                 ledger::TokenLedger& token,
                 ledger::ReserveBank& bank,
                 events::EventSink* sink = nullptr,
                 ledger::LiquidityProvisioner* liquidity = nullptr);

    BondingCurve(const BondingCurve&) = delete;
    BondingCurve& operator=(const BondingCurve&) = delete;

    // Spend reserve_in of the trader's reserve asset on tokens.
    // May graduate the curve as a side effect.
    TradeResult buy(const Address& trader, const uint256_t& reserve_in);

    // Sell units_in tokens back; the trader must have approved the curve on the token ledger.
    TradeResult sell(const Address& trader, const uint256_t& units_in);

    void pause(const Address& caller);
    void unpause(const Address& caller);
    bool paused() const { return paused_; }

    // Read-only sizing
    TradeQuote<uint256_t> quote_buy(const uint256_t& reserve_in) const;
    TradeQuote<uint256_t> quote_sell(const uint256_t& units_in) const;

    // Queries
    uint256_t current_price() const;
    const uint256_t& total_raised() const { return state_.total_raised; }
    const uint256_t& current_reserves() const { return state_.current_reserves; }
    const uint256_t& units_sold() const { return state_.units_sold; }
    const uint256_t& base_price() const { return state_.base_price; }
    bool graduated() const { return state_.graduated(); }
    Phase phase() const { return state_.phase; }
    uint256_t graduation_progress() const;
    const uint256_t& graduation_threshold() const { return GRADUATION_THRESHOLD(); }
    uint256_t purchase_amount(const Address& trader) const;
    StateView state() const;
    DetailedState detailed_state() const;
    const CurveConfig& config() const { return cfg_; }
    static const char* version() { return curve::version(); }

    void set_block_timestamp(uint64_t ts) { block_timestamp_ = ts; }
    uint64_t block_timestamp() const { return block_timestamp_; }

private:
    void graduate(Transaction& tx);
    void check_invariants() const;
    void require_owner(const Address& caller) const;

    // Best-effort delivery; sink failures are logged, never propagated
    void notify(const events::Event& ev) const;

    CurveConfig cfg_;
    ledger::TokenLedger& token_;
    ledger::ReserveBank& bank_;
    events::EventSink* sink_;
    ledger::LiquidityProvisioner* liquidity_;

    CurveState state_;
    std::atomic<bool> paused_{false};
    uint64_t block_timestamp_{0};
    ReentrancyGuard guard_;
};

} // namespace curve
} // namespace lc
