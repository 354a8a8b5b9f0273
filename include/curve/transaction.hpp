// All-or-nothing scope for one curve operation
#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

#include "curve/state.hpp"
#include "ledger/interfaces.hpp"

namespace lc {
namespace curve {

// Saves the scalar curve state and checkpoints every ledger on entry.
// Per-wallet purchase totals are written through set_purchase_amount so only
// the touched wallets are journaled.
// Unless commit() runs, destruction restores the state, reverts the ledgers
// (newest first) and drops deferred work. commit() releases the checkpoints and
// then runs deferred work (notifications) in order.
class Transaction {
public:
    Transaction(CurveState& state, std::initializer_list<ledger::Journaled*> ledgers)
        : state_(state),
          saved_{state.total_raised, state.current_reserves, state.units_sold, state.phase} {
        entries_.reserve(ledgers.size());
        try {
            for (auto* l : ledgers) {
                entries_.push_back({l, l->checkpoint()});
            }
        } catch (...) {
            rollback();
            throw;
        }
    }

    ~Transaction() {
        if (!committed_) rollback();
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void defer(std::function<void()> fn) { deferred_.push_back(std::move(fn)); }

    void set_purchase_amount(const Address& trader, const uint256_t& amount) {
        auto& m = state_.purchase_amounts;
        auto it = m.find(trader);
        purchases_.emplace_back(trader, it == m.end() ? std::nullopt : std::optional<uint256_t>(it->second));
        m[trader] = amount;
    }

    void commit() {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            it->ledger->release(it->id);
        }
        committed_ = true;
        auto work = std::move(deferred_);
        deferred_.clear();
        for (auto& fn : work) fn();
    }

private:
    struct Entry {
        ledger::Journaled* ledger;
        std::size_t id;
    };

    struct Saved {
        uint256_t total_raised;
        uint256_t current_reserves;
        uint256_t units_sold;
        Phase phase;
    };

    void rollback() noexcept {
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            it->ledger->revert_to(it->id);
        }
        entries_.clear();

        auto& m = state_.purchase_amounts;
        for (auto it = purchases_.rbegin(); it != purchases_.rend(); ++it) {
            if (it->second) {
                m[it->first] = *it->second;
            } else {
                m.erase(it->first);
            }
        }
        purchases_.clear();

        state_.total_raised = saved_.total_raised;
        state_.current_reserves = saved_.current_reserves;
        state_.units_sold = saved_.units_sold;
        state_.phase = saved_.phase;
    }

    CurveState& state_;
    Saved saved_;
    std::vector<std::pair<Address, std::optional<uint256_t>>> purchases_;
    std::vector<Entry> entries_;
    std::vector<std::function<void()>> deferred_;
    bool committed_{false};
};

} // namespace curve
} // namespace lc
