// Bonding curve market maker - implementation
#include "curve/bonding_curve.hpp"

#include <stdexcept>
#include <string>

#include "core/common.hpp"

namespace lc {
namespace curve {

void validate(const CurveConfig& cfg) {
    if (cfg.curve.empty()) throw std::invalid_argument("curve address is empty");
    if (cfg.token.empty()) throw std::invalid_argument("token address is empty");
    if (cfg.creator.empty()) throw std::invalid_argument("creator address is empty");
    if (cfg.treasury.empty()) throw std::invalid_argument("treasury address is empty");
    if (cfg.owner.empty()) throw std::invalid_argument("owner address is empty");
    if (cfg.base_price == 0) throw std::invalid_argument("base price must be positive");
    if (cfg.base_price > MAX_BASE_PRICE()) throw std::invalid_argument("base price exceeds 2^128");
}

BondingCurve::BondingCurve(const CurveConfig& cfg,
                           ledger::TokenLedger& token,
                           ledger::ReserveBank& bank,
                           events::EventSink* sink,
                           ledger::LiquidityProvisioner* liquidity)
    : cfg_(cfg), token_(token), bank_(bank), sink_(sink), liquidity_(liquidity) {
    validate(cfg_);
    state_.base_price = cfg_.base_price;
}

TradeResult BondingCurve::buy(const Address& trader, const uint256_t& reserve_in) {
    ReentrancyGuard::Scope entry(guard_);

    if (paused_) throw trading_paused();
    if (reserve_in == 0) throw invalid_trade("Must send CORE to buy tokens");
    if (state_.graduated()) throw invalid_trade("Token has graduated");

    const TradeQuote<uint256_t> q = Math::quote_buy(state_.base_price, state_.units_sold, reserve_in);
    if (q.amount == 0) throw invalid_trade("Insufficient CORE for token purchase");

    const uint256_t net = reserve_in - q.fee;
    const uint256_t held = purchase_amount(trader);
    if (held + q.amount > MAX_PURCHASE()) {
        notify(events::LargePurchaseAttempted{
            cfg_.token, trader, cfg_.curve, q.amount, held, MAX_PURCHASE(), block_timestamp_});
        throw purchase_limit_exceeded();
    }

    Transaction tx(state_, {&token_, &bank_});

    // Value attached to the call
    bank_.send(trader, cfg_.curve, reserve_in);

    state_.units_sold += q.amount;
    state_.total_raised += net;
    state_.current_reserves += net;
    tx.set_purchase_amount(trader, held + q.amount);

    token_.transfer(cfg_.curve, trader, q.amount);
    if (q.fee > 0) {
        bank_.send(cfg_.curve, cfg_.treasury, q.fee);
    }

    TradeResult res;
    res.reserve_amount = reserve_in;
    res.token_amount = q.amount;
    res.fee = q.fee;
    res.clamped = q.clamped;
    res.new_price = current_price();

    const uint64_t ts = block_timestamp_;
    tx.defer([this, trader, res, ts] {
        notify(events::TokenPurchased{trader, res.reserve_amount, res.token_amount});
        notify(events::TokenTraded{cfg_.token, trader, cfg_.curve, true, res.reserve_amount,
                                   res.token_amount, res.new_price, res.fee, ts});
        if (res.fee > 0) {
            notify(events::PlatformFeeCollected{cfg_.curve, "trading", res.fee, ts});
        }
    });

    if (state_.total_raised >= GRADUATION_THRESHOLD()) {
        graduate(tx);
        res.graduated = true;
    }

    check_invariants();
    tx.commit();
    return res;
}

TradeResult BondingCurve::sell(const Address& trader, const uint256_t& units_in) {
    ReentrancyGuard::Scope entry(guard_);

    if (paused_) throw trading_paused();
    if (units_in == 0) throw invalid_trade("Amount must be greater than 0");
    if (state_.graduated()) throw invalid_trade("Token has graduated");
    if (token_.balance_of(trader) < units_in) throw invalid_trade("Insufficient token balance");
    if (units_in > state_.units_sold) throw invalid_trade("Cannot sell more than sold");

    const TradeQuote<uint256_t> q = Math::quote_sell(state_.base_price, state_.units_sold, units_in);
    const uint256_t gross = q.amount + q.fee;
    if (bank_.balance_of(cfg_.curve) < gross) {
        throw invalid_trade("Insufficient CORE in contract");
    }
    if (gross > state_.current_reserves) {
        throw invariant_violation("sell payout exceeds curve reserves");
    }

    Transaction tx(state_, {&token_, &bank_});

    // total_raised is a high-water mark and stays put
    state_.units_sold -= units_in;
    state_.current_reserves -= gross;

    token_.transfer_from(cfg_.curve, trader, cfg_.curve, units_in);
    bank_.send(cfg_.curve, trader, q.amount);
    if (q.fee > 0) {
        bank_.send(cfg_.curve, cfg_.treasury, q.fee);
    }

    TradeResult res;
    res.reserve_amount = q.amount;
    res.token_amount = units_in;
    res.fee = q.fee;
    res.new_price = current_price();

    const uint64_t ts = block_timestamp_;
    tx.defer([this, trader, res, ts] {
        notify(events::TokenSold{trader, res.token_amount, res.reserve_amount});
        notify(events::TokenTraded{cfg_.token, trader, cfg_.curve, false, res.reserve_amount,
                                   res.token_amount, res.new_price, res.fee, ts});
        if (res.fee > 0) {
            notify(events::PlatformFeeCollected{cfg_.curve, "trading", res.fee, ts});
        }
    });

    check_invariants();
    tx.commit();
    return res;
}

// Runs inside the enclosing buy's transaction and guard scope
void BondingCurve::graduate(Transaction& tx) {
    if (state_.graduated()) {
        throw invariant_violation("Already graduated");
    }

    const uint256_t available = state_.current_reserves;
    const uint256_t liquidity_reserve = available * LIQUIDITY_PCT / 100;
    const uint256_t creator_bonus = available * CREATOR_PCT / 100;
    const uint256_t treasury_amount = available - liquidity_reserve - creator_bonus;
    const uint256_t token_amount = token_.balance_of(cfg_.curve);

    state_.phase = Phase::Graduated;
    state_.current_reserves = 0;

    if (creator_bonus > 0) {
        bank_.send(cfg_.curve, cfg_.creator, creator_bonus);
    }
    if (treasury_amount > 0) {
        bank_.send(cfg_.curve, cfg_.treasury, treasury_amount);
    }

    // Part of the graduating buy: a failure here reverts the whole trade
    if (liquidity_) {
        liquidity_->provide(cfg_.token, token_amount, liquidity_reserve);
    }

    const uint256_t raised = state_.total_raised;
    const uint64_t ts = block_timestamp_;
    tx.defer([this, token_amount, liquidity_reserve, creator_bonus, treasury_amount, raised, ts] {
        notify(events::LiquidityCreated{cfg_.token, token_amount, liquidity_reserve});
        notify(events::Graduated{raised, liquidity_reserve, creator_bonus, treasury_amount});
        notify(events::TokenGraduated{cfg_.token, cfg_.creator, raised, liquidity_reserve, creator_bonus, ts});
        if (treasury_amount > 0) {
            notify(events::PlatformFeeCollected{cfg_.curve, "graduation", treasury_amount, ts});
        }
    });
}

void BondingCurve::check_invariants() const {
    if (state_.current_reserves > state_.total_raised) {
        throw invariant_violation("current reserves exceed total raised");
    }
    if (state_.units_sold > SELLABLE_SUPPLY()) {
        throw invariant_violation("units sold exceed sellable supply");
    }
}

void BondingCurve::require_owner(const Address& caller) const {
    if (caller != cfg_.owner) {
        throw unauthorized("Not the owner");
    }
}

void BondingCurve::pause(const Address& caller) {
    require_owner(caller);
    paused_ = true;
}

void BondingCurve::unpause(const Address& caller) {
    require_owner(caller);
    paused_ = false;
}

TradeQuote<uint256_t> BondingCurve::quote_buy(const uint256_t& reserve_in) const {
    if (state_.graduated()) return {};
    return Math::quote_buy(state_.base_price, state_.units_sold, reserve_in);
}

TradeQuote<uint256_t> BondingCurve::quote_sell(const uint256_t& units_in) const {
    if (state_.graduated()) return {};
    return Math::quote_sell(state_.base_price, state_.units_sold, units_in);
}

uint256_t BondingCurve::current_price() const {
    return Math::price(state_.base_price, state_.units_sold);
}

uint256_t BondingCurve::graduation_progress() const {
    return state_.total_raised * 100 / GRADUATION_THRESHOLD();
}

uint256_t BondingCurve::purchase_amount(const Address& trader) const {
    auto it = state_.purchase_amounts.find(trader);
    return it == state_.purchase_amounts.end() ? uint256_t(0) : it->second;
}

StateView BondingCurve::state() const {
    StateView v;
    v.current_price = current_price();
    v.total_raised = state_.total_raised;
    v.units_sold = state_.units_sold;
    v.graduated = state_.graduated();
    v.graduation_progress = graduation_progress();
    return v;
}

DetailedState BondingCurve::detailed_state() const {
    DetailedState d;
    d.current_price = current_price();
    d.total_raised = state_.total_raised;
    d.current_reserves = state_.current_reserves;
    d.units_sold = state_.units_sold;
    d.graduated = state_.graduated();
    return d;
}

void BondingCurve::notify(const events::Event& ev) const {
    if (!sink_) return;
    try {
        sink_->publish(cfg_.curve, ev);
    } catch (const std::exception& e) {
        log_warn(std::string("notification dropped by sink for curve ") + cfg_.curve + ": " + e.what());
    }
}

} // namespace curve
} // namespace lc
