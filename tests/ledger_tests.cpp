// In-memory ledgers: journaled checkpoints, allowances, recipient hooks; event hub

#include <boost/test/unit_test.hpp>

#include <stdexcept>

#include "curve/errors.hpp"
#include "events/sink.hpp"
#include "ledger/memory_ledger.hpp"

using namespace lc;
using namespace lc::ledger;

BOOST_AUTO_TEST_SUITE(ledger_tests)

BOOST_AUTO_TEST_CASE(token_mint_and_transfer)
{
    InMemoryTokenLedger t("ABC");
    BOOST_CHECK_EQUAL(t.symbol(), "ABC");

    t.mint("a", uint256_t(100));
    t.mint("b", uint256_t(50));
    BOOST_CHECK_EQUAL(t.total_supply(), uint256_t(150));

    t.transfer("a", "c", uint256_t(30));
    BOOST_CHECK_EQUAL(t.balance_of("a"), uint256_t(70));
    BOOST_CHECK_EQUAL(t.balance_of("c"), uint256_t(30));
    BOOST_CHECK_THROW(t.transfer("c", "a", uint256_t(31)), curve::transfer_failed);

    t.approve("a", "spender", uint256_t(20));
    BOOST_CHECK_THROW(t.transfer_from("spender", "a", "b", uint256_t(21)), curve::transfer_failed);
    t.transfer_from("spender", "a", "b", uint256_t(15));
    BOOST_CHECK_EQUAL(t.allowance("a", "spender"), uint256_t(5));
    BOOST_CHECK_EQUAL(t.balance_of("b"), uint256_t(65));
    BOOST_CHECK_EQUAL(t.total_supply(), uint256_t(150));
}

BOOST_AUTO_TEST_CASE(token_revert_restores_touched_slots)
{
    InMemoryTokenLedger t;
    t.mint("a", uint256_t(100));
    t.approve("a", "s", uint256_t(10));
    const auto balances = t.balances();

    const auto cp = t.checkpoint();
    t.transfer("a", "fresh", uint256_t(40));
    t.transfer_from("s", "a", "b", uint256_t(10));
    t.approve("a", "other", uint256_t(7));
    t.mint("a", uint256_t(5));
    t.revert_to(cp);

    // Accounts first created inside the checkpoint are gone again
    BOOST_CHECK(t.balances() == balances);
    BOOST_CHECK_EQUAL(t.balances().count("fresh"), 0u);
    BOOST_CHECK_EQUAL(t.allowance("a", "s"), uint256_t(10));
    BOOST_CHECK_EQUAL(t.allowance("a", "other"), uint256_t(0));
    BOOST_CHECK_EQUAL(t.total_supply(), uint256_t(100));
    BOOST_CHECK_EQUAL(t.open_checkpoints(), 0u);
}

BOOST_AUTO_TEST_CASE(token_nested_checkpoints)
{
    InMemoryTokenLedger t;
    t.mint("a", uint256_t(100));

    const auto outer = t.checkpoint();
    t.transfer("a", "b", uint256_t(10));

    const auto inner = t.checkpoint();
    t.transfer("a", "b", uint256_t(20));
    t.revert_to(inner);
    BOOST_CHECK_EQUAL(t.balance_of("b"), uint256_t(10));

    // A released inner checkpoint still rolls back with its outer one
    const auto inner2 = t.checkpoint();
    t.transfer("a", "c", uint256_t(5));
    t.release(inner2);
    BOOST_CHECK_EQUAL(t.open_checkpoints(), 1u);

    t.revert_to(outer);
    BOOST_CHECK_EQUAL(t.balance_of("a"), uint256_t(100));
    BOOST_CHECK_EQUAL(t.balances().size(), 1u);

    // Released at the top: changes stick
    const auto cp = t.checkpoint();
    t.transfer("a", "b", uint256_t(1));
    t.release(cp);
    BOOST_CHECK_EQUAL(t.open_checkpoints(), 0u);
    t.revert_to(cp);
    BOOST_CHECK_EQUAL(t.balance_of("b"), uint256_t(1));
}

BOOST_AUTO_TEST_CASE(bank_hooks_and_rollback)
{
    InMemoryReserveBank bank;
    bank.deposit("a", uint256_t(100));

    BOOST_CHECK_THROW(bank.send("a", "b", uint256_t(101)), curve::transfer_failed);

    bank.set_hook("b", [](const Address&, const uint256_t&) { return false; });
    BOOST_CHECK_THROW(bank.send("a", "b", uint256_t(10)), curve::transfer_failed);
    BOOST_CHECK_EQUAL(bank.balance_of("a"), uint256_t(100));
    BOOST_CHECK_EQUAL(bank.balances().count("b"), 0u);

    bank.set_hook("b", [](const Address&, const uint256_t&) -> bool {
        throw std::runtime_error("recipient blew up");
    });
    BOOST_CHECK_THROW(bank.send("a", "b", uint256_t(10)), std::runtime_error);
    BOOST_CHECK_EQUAL(bank.balance_of("a"), uint256_t(100));

    // Hook forwards half of what it receives; both moves roll back together
    bank.set_hook("b", [&bank](const Address&, const uint256_t& amount) {
        bank.send("b", "c", amount / 2);
        return true;
    });
    const auto cp = bank.checkpoint();
    bank.send("a", "b", uint256_t(40));
    BOOST_CHECK_EQUAL(bank.balance_of("b"), uint256_t(20));
    BOOST_CHECK_EQUAL(bank.balance_of("c"), uint256_t(20));
    BOOST_CHECK_EQUAL(bank.open_checkpoints(), 1u);
    bank.revert_to(cp);
    BOOST_CHECK_EQUAL(bank.balance_of("a"), uint256_t(100));
    BOOST_CHECK_EQUAL(bank.balances().size(), 1u);
    BOOST_CHECK_EQUAL(bank.open_checkpoints(), 0u);
}

BOOST_AUTO_TEST_CASE(hub_authorization_and_disabled_log)
{
    events::EventRecorder hub(false);
    BOOST_CHECK(!hub.enabled());
    BOOST_CHECK(!hub.is_authorized("curve"));
    BOOST_CHECK_THROW(hub.authorize(""), std::invalid_argument);

    const events::Event traded = events::TokenTraded{};
    BOOST_CHECK_THROW(hub.publish("curve", traded), curve::unauthorized);

    hub.authorize("curve");
    BOOST_CHECK(hub.is_authorized("curve"));
    BOOST_CHECK_NO_THROW(hub.publish("curve", traded));
    BOOST_CHECK_EQUAL(hub.size(), 0u);

    events::EventRecorder logging_hub;
    BOOST_CHECK(logging_hub.enabled());
    logging_hub.publish("anyone", events::Event(events::TokenPurchased{}));
    BOOST_CHECK_EQUAL(logging_hub.size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
