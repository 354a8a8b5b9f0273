// Trade executor: buys, sells, fees, limits, pause, atomicity

#include <boost/test/unit_test.hpp>

#include <memory>
#include <stdexcept>
#include <string>

#include "curve_fixture.hpp"
#include "curve/errors.hpp"

using namespace lc;
using namespace lc::curve;
using lc::test::CurveFixture;

namespace {

// Rejects everything it is handed
class FailingSink : public events::EventSink {
public:
    void publish(const Address&, const events::Event&) override {
        ++attempts;
        throw std::runtime_error("sink offline");
    }
    int attempts{0};
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(executor_tests, CurveFixture)

BOOST_AUTO_TEST_CASE(buy_reference_launch)
{
    fund("alice", uint256_t(5000000));
    const auto r = buy("alice", uint256_t(1010101));

    BOOST_CHECK_EQUAL(r.fee, uint256_t(10101));
    BOOST_CHECK_EQUAL(r.token_amount, uint256_t("9999875002604101564290"));
    BOOST_CHECK(!r.graduated);

    BOOST_CHECK_EQUAL(bank.balance_of("alice"), uint256_t(5000000 - 1010101));
    BOOST_CHECK_EQUAL(bank.balance_of("treasury"), uint256_t(10101));
    BOOST_CHECK_EQUAL(bank.balance_of("curve"), uint256_t(1000000));
    BOOST_CHECK_EQUAL(token.balance_of("alice"), r.token_amount);

    BOOST_CHECK_EQUAL(market->total_raised(), uint256_t(1000000));
    BOOST_CHECK_EQUAL(market->current_reserves(), uint256_t(1000000));
    BOOST_CHECK_EQUAL(market->units_sold(), r.token_amount);
    BOOST_CHECK_EQUAL(market->purchase_amount("alice"), r.token_amount);
    BOOST_CHECK(market->current_price() > uint256_t(100));
    BOOST_CHECK_EQUAL(r.new_price, market->current_price());
}

BOOST_AUTO_TEST_CASE(buy_notifications)
{
    fund("alice", uint256_t(5000000));
    buy("alice", uint256_t(1010101));

    BOOST_CHECK_EQUAL(hub.count<events::TokenPurchased>(), 1u);
    BOOST_CHECK_EQUAL(hub.count<events::TokenTraded>(), 1u);
    BOOST_CHECK_EQUAL(hub.count<events::PlatformFeeCollected>(), 1u);

    const auto evs = hub.events();
    BOOST_REQUIRE_EQUAL(evs.size(), 3u);
    const auto& traded = std::get<events::TokenTraded>(evs[1]);
    BOOST_CHECK(traded.is_buy);
    BOOST_CHECK_EQUAL(traded.trader, "alice");
    BOOST_CHECK_EQUAL(traded.fee, uint256_t(10101));
    BOOST_CHECK_EQUAL(traded.timestamp, 1700000000ULL);
    const auto& fee = std::get<events::PlatformFeeCollected>(evs[2]);
    BOOST_CHECK_EQUAL(fee.fee_type, "trading");
    BOOST_CHECK_EQUAL(fee.amount, uint256_t(10101));
}

BOOST_AUTO_TEST_CASE(buy_rejects_bad_input)
{
    fund("alice", uint256_t(5000000));
    const auto before = snapshot();

    BOOST_CHECK_THROW(buy("alice", 0), invalid_trade);
    // Not funded
    BOOST_CHECK_THROW(buy("bob", uint256_t(1000000)), transfer_failed);

    BOOST_CHECK(CurveFixture::same(before, snapshot()));
}

BOOST_AUTO_TEST_CASE(dust_buy_sizes_to_nothing)
{
    // At this base price one wei is worth less than one token unit
    CurveConfig steep = cfg;
    steep.base_price = uint256_t("1000000000000000000000000000000");
    BondingCurve pricey(steep, token, bank, &hub);
    fund("alice", uint256_t(100));

    BOOST_CHECK_THROW(pricey.buy("alice", uint256_t(1)), invalid_trade);
    BOOST_CHECK_EQUAL(bank.balance_of("alice"), uint256_t(100));
    BOOST_CHECK_EQUAL(pricey.units_sold(), uint256_t(0));
}

BOOST_AUTO_TEST_CASE(sell_pays_out_net_of_fee)
{
    fund("alice", uint256_t(5000000));
    const auto b = buy("alice", uint256_t(1000000));
    const uint256_t raised = market->total_raised();
    const uint256_t reserves = market->current_reserves();
    const uint256_t treasury = bank.balance_of("treasury");
    const uint256_t cash = bank.balance_of("alice");

    const uint256_t half = b.token_amount / 2;
    const auto q = market->quote_sell(half);
    const auto s = sell("alice", half);

    BOOST_CHECK_EQUAL(s.token_amount, half);
    BOOST_CHECK_EQUAL(s.reserve_amount, q.amount);
    BOOST_CHECK_EQUAL(s.fee, q.fee);
    BOOST_CHECK_EQUAL(bank.balance_of("alice"), cash + q.amount);
    BOOST_CHECK_EQUAL(bank.balance_of("treasury"), treasury + q.fee);
    BOOST_CHECK_EQUAL(token.balance_of("alice"), b.token_amount - half);
    BOOST_CHECK_EQUAL(token.balance_of("curve"), TOTAL_SUPPLY() - b.token_amount + half);

    // Raised is a high-water mark; reserves drop by the gross payout
    BOOST_CHECK_EQUAL(market->total_raised(), raised);
    BOOST_CHECK_EQUAL(market->current_reserves(), reserves - (q.amount + q.fee));
    BOOST_CHECK_EQUAL(market->units_sold(), b.token_amount - half);
    BOOST_CHECK_EQUAL(bank.balance_of("curve"), market->current_reserves());

    // Selling does not give back purchase room
    BOOST_CHECK_EQUAL(market->purchase_amount("alice"), b.token_amount);

    BOOST_CHECK_EQUAL(hub.count<events::TokenSold>(), 1u);
    BOOST_CHECK_EQUAL(hub.count<events::TokenTraded>(), 2u);
}

BOOST_AUTO_TEST_CASE(round_trip_never_gains)
{
    fund("alice", uint256_t(5000000));
    const auto b = buy("alice", uint256_t(1000000));
    const auto s = sell("alice", b.token_amount);

    BOOST_CHECK(s.reserve_amount + s.fee <= uint256_t(1000000) - b.fee);
    BOOST_CHECK(bank.balance_of("alice") < uint256_t(5000000));
    BOOST_CHECK_EQUAL(market->units_sold(), uint256_t(0));
    BOOST_CHECK_EQUAL(market->current_price(), uint256_t(100));
    BOOST_CHECK_EQUAL(bank.balance_of("curve"), market->current_reserves());
}

BOOST_AUTO_TEST_CASE(sell_rejects_bad_input)
{
    fund("alice", uint256_t(5000000));
    fund("bob", uint256_t(5000000));
    const auto b = buy("alice", uint256_t(1000000));
    const auto before = snapshot();

    BOOST_CHECK_THROW(sell("alice", 0), invalid_trade);
    BOOST_CHECK_THROW(sell("alice", b.token_amount + 1), invalid_trade);
    BOOST_CHECK_THROW(sell("bob", uint256_t(1)), invalid_trade);

    // No allowance: the token pull fails and nothing moves
    token.approve("alice", "curve", 0);
    BOOST_CHECK_THROW(market->sell("alice", b.token_amount), transfer_failed);

    BOOST_CHECK(CurveFixture::same(before, snapshot()));
}

BOOST_AUTO_TEST_CASE(sell_cannot_exceed_units_sold)
{
    // Tokens that reached a wallet outside the curve cannot be sold past what the curve sold
    fund("alice", uint256_t(5000000));
    const auto b = buy("alice", uint256_t(1000000));
    token.mint("whale", b.token_amount * 2);

    BOOST_CHECK_THROW(sell("whale", b.token_amount + 1), invalid_trade);
    BOOST_CHECK_NO_THROW(sell("whale", b.token_amount));
    BOOST_CHECK_EQUAL(market->units_sold(), uint256_t(0));
}

BOOST_AUTO_TEST_CASE(purchase_cap_aborts_with_diagnostic)
{
    fund("alice", uint256_t("100000000000"));
    const auto before = snapshot();

    // At base 100, 5e9 in sizes to ~4.67e25 units, over the 4e25 cap
    BOOST_CHECK_THROW(buy("alice", uint256_t(5000000000ULL)), purchase_limit_exceeded);

    const auto after = snapshot();
    BOOST_CHECK(after.reserves == before.reserves);
    BOOST_CHECK(after.tokens == before.tokens);
    BOOST_CHECK_EQUAL(after.state.units_sold, uint256_t(0));
    BOOST_CHECK_EQUAL(after.state.total_raised, uint256_t(0));

    // The diagnostic goes out even though the trade aborted
    BOOST_REQUIRE_EQUAL(hub.count<events::LargePurchaseAttempted>(), 1u);
    const auto lp = std::get<events::LargePurchaseAttempted>(hub.events().back());
    BOOST_CHECK_EQUAL(lp.buyer, "alice");
    BOOST_CHECK_EQUAL(lp.max_allowed, MAX_PURCHASE());
    BOOST_CHECK_EQUAL(lp.current_holdings, uint256_t(0));
    BOOST_CHECK(lp.attempted_amount > MAX_PURCHASE());
}

BOOST_AUTO_TEST_CASE(purchase_cap_is_cumulative)
{
    fund("alice", uint256_t("100000000000"));
    const auto first = buy("alice", uint256_t(3000000000ULL));
    BOOST_CHECK(first.token_amount < MAX_PURCHASE());

    // Room left is under what another 3e9 buys
    BOOST_CHECK_THROW(buy("alice", uint256_t(3000000000ULL)), purchase_limit_exceeded);
    BOOST_CHECK_EQUAL(market->purchase_amount("alice"), first.token_amount);

    // Selling back does not reset the counter
    sell("alice", first.token_amount);
    BOOST_CHECK_THROW(buy("alice", uint256_t(3000000000ULL)), purchase_limit_exceeded);

    // Another wallet is unaffected
    fund("bob", uint256_t("100000000000"));
    BOOST_CHECK_NO_THROW(buy("bob", uint256_t(3000000000ULL)));
}

BOOST_AUTO_TEST_CASE(sellout_clamps_final_buy)
{
    using Math = BondingCurve::Math;
    const uint256_t chunk("39000000000000000000000000");
    int n = 0;

    while (SELLABLE_SUPPLY() - market->units_sold() > chunk) {
        const std::string w = "w" + std::to_string(n++);
        const uint256_t sold = market->units_sold();
        const uint256_t r = Math::area(cfg.base_price, sold, sold + chunk) * 100 / 99 + 100;
        fund(w, r);
        const auto res = buy(w, r);
        BOOST_REQUIRE(res.token_amount <= MAX_PURCHASE());
        BOOST_REQUIRE(!res.clamped);
    }
    BOOST_CHECK_EQUAL(n, 20);

    const uint256_t remaining = SELLABLE_SUPPLY() - market->units_sold();
    const uint256_t raised = market->total_raised();
    const uint256_t big = Math::area(cfg.base_price, market->units_sold(), SELLABLE_SUPPLY()) * 2 + 1000;
    fund("last", big);
    const auto res = buy("last", big);

    BOOST_CHECK(res.clamped);
    BOOST_CHECK_EQUAL(res.token_amount, remaining);
    BOOST_CHECK_EQUAL(market->units_sold(), SELLABLE_SUPPLY());
    BOOST_CHECK_EQUAL(market->current_price(), cfg.base_price * 4);

    // Fee on the full input and the full net input is credited
    BOOST_CHECK_EQUAL(res.fee, big / 100);
    BOOST_CHECK_EQUAL(market->total_raised(), raised + big - big / 100);
    BOOST_CHECK(!market->graduated());

    // Nothing left to sell
    fund("late", uint256_t(1000000));
    BOOST_CHECK_THROW(buy("late", uint256_t(1000000)), invalid_trade);
    BOOST_CHECK_EQUAL(bank.balance_of("curve"), market->current_reserves());
}

BOOST_AUTO_TEST_CASE(pause_is_owner_only)
{
    fund("alice", uint256_t(5000000));

    BOOST_CHECK_THROW(market->pause("alice"), unauthorized);
    BOOST_CHECK(!market->paused());

    market->pause("owner");
    BOOST_CHECK(market->paused());
    BOOST_CHECK_THROW(buy("alice", uint256_t(1000000)), trading_paused);

    BOOST_CHECK_THROW(market->unpause("alice"), unauthorized);
    market->unpause("owner");
    const auto b = buy("alice", uint256_t(1000000));

    market->pause("owner");
    BOOST_CHECK_THROW(sell("alice", b.token_amount), trading_paused);
    market->unpause("owner");
    BOOST_CHECK_NO_THROW(sell("alice", b.token_amount));
}

BOOST_AUTO_TEST_CASE(rejecting_treasury_rolls_back_buy)
{
    fund("alice", uint256_t(5000000));
    bank.set_hook("treasury", [](const Address&, const uint256_t&) { return false; });
    const auto before = snapshot();

    BOOST_CHECK_THROW(buy("alice", uint256_t(1000000)), transfer_failed);
    BOOST_CHECK(CurveFixture::same(before, snapshot()));
    BOOST_CHECK_EQUAL(market->purchase_amount("alice"), uint256_t(0));

    bank.clear_hook("treasury");
    BOOST_CHECK_NO_THROW(buy("alice", uint256_t(1000000)));
}

BOOST_AUTO_TEST_CASE(rejecting_seller_rolls_back_sell)
{
    fund("alice", uint256_t(5000000));
    const auto b = buy("alice", uint256_t(1000000));
    bank.set_hook("alice", [](const Address&, const uint256_t&) { return false; });
    const auto before = snapshot();

    BOOST_CHECK_THROW(sell("alice", b.token_amount), transfer_failed);
    BOOST_CHECK(CurveFixture::same(before, snapshot()));
    BOOST_CHECK_EQUAL(token.balance_of("alice"), b.token_amount);
}

BOOST_AUTO_TEST_CASE(failing_sink_does_not_block_trades)
{
    FailingSink sink;
    BondingCurve quiet(cfg, token, bank, &sink);
    fund("alice", uint256_t(5000000));

    const auto r = quiet.buy("alice", uint256_t(1000000));
    BOOST_CHECK(r.token_amount > 0);
    BOOST_CHECK_EQUAL(sink.attempts, 3);
    BOOST_CHECK_EQUAL(token.balance_of("alice"), r.token_amount);
}

BOOST_AUTO_TEST_CASE(unregistered_emitter_keeps_local_log)
{
    hub.authorize("curve", false);
    BOOST_CHECK(!hub.is_authorized("curve"));
    fund("alice", uint256_t(5000000));

    BOOST_CHECK_NO_THROW(buy("alice", uint256_t(1000000)));
    BOOST_CHECK_EQUAL(hub.count<events::TokenPurchased>(), 1u);
    BOOST_CHECK_EQUAL(hub.count<events::TokenTraded>(), 0u);
    BOOST_CHECK_EQUAL(hub.count<events::PlatformFeeCollected>(), 0u);
}

BOOST_AUTO_TEST_CASE(quotes_do_not_mutate)
{
    fund("alice", uint256_t(5000000));
    const auto before = snapshot();
    const auto q = market->quote_buy(uint256_t(1010101));
    BOOST_CHECK(CurveFixture::same(before, snapshot()));

    const auto r = buy("alice", uint256_t(1010101));
    BOOST_CHECK_EQUAL(q.amount, r.token_amount);
    BOOST_CHECK_EQUAL(q.fee, r.fee);
}

BOOST_AUTO_TEST_CASE(state_views)
{
    fund("alice", uint256_t(5000000));
    buy("alice", uint256_t(1000000));

    const auto v = market->state();
    const auto d = market->detailed_state();
    BOOST_CHECK_EQUAL(v.total_raised, d.total_raised);
    BOOST_CHECK_EQUAL(v.units_sold, d.units_sold);
    BOOST_CHECK_EQUAL(v.current_price, d.current_price);
    BOOST_CHECK_EQUAL(d.current_reserves, uint256_t(990000));
    BOOST_CHECK_EQUAL(v.graduation_progress, uint256_t(0));
    BOOST_CHECK(!v.graduated);
    BOOST_CHECK(market->phase() == Phase::Trading);
    BOOST_CHECK_EQUAL(std::string(BondingCurve::version()), "2.2.0-comprehensive-fixes");
}

BOOST_AUTO_TEST_CASE(config_validation)
{
    CurveConfig bad = cfg;
    bad.base_price = 0;
    BOOST_CHECK_THROW(std::make_unique<BondingCurve>(bad, token, bank), std::invalid_argument);

    bad = cfg;
    bad.treasury.clear();
    BOOST_CHECK_THROW(validate(bad), std::invalid_argument);

    // Bases past 2^128 would overflow the 512-bit area intermediate
    bad = cfg;
    bad.base_price = MAX_BASE_PRICE() + 1;
    BOOST_CHECK_THROW(validate(bad), std::invalid_argument);
    bad.base_price = MAX_BASE_PRICE();
    BOOST_CHECK_NO_THROW(validate(bad));
}

BOOST_AUTO_TEST_SUITE_END()
