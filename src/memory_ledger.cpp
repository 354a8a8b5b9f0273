// In-memory ledgers - implementation
#include "ledger/memory_ledger.hpp"

#include "curve/errors.hpp"

namespace lc {
namespace ledger {

using curve::transfer_failed;

// -----------------------------------------------------------------------------
// InMemoryTokenLedger
// -----------------------------------------------------------------------------

void InMemoryTokenLedger::set_balance(const Address& account, const uint256_t& amount) {
    auto it = balances_.find(account);
    if (!marks_.empty()) {
        journal_.push_back({Undo::Slot::Balance, account, Address(),
                            it == balances_.end() ? std::nullopt : std::optional<uint256_t>(it->second)});
    }
    if (it == balances_.end()) {
        balances_.emplace(account, amount);
    } else {
        it->second = amount;
    }
}

void InMemoryTokenLedger::set_allowance(const Address& owner, const Address& spender, const uint256_t& amount) {
    if (!marks_.empty()) {
        std::optional<uint256_t> prev;
        auto it = allowances_.find(owner);
        if (it != allowances_.end()) {
            auto jt = it->second.find(spender);
            if (jt != it->second.end()) prev = jt->second;
        }
        journal_.push_back({Undo::Slot::Allowance, owner, spender, prev});
    }
    allowances_[owner][spender] = amount;
}

void InMemoryTokenLedger::set_total_supply(const uint256_t& amount) {
    if (!marks_.empty()) {
        journal_.push_back({Undo::Slot::Supply, Address(), Address(), total_supply_});
    }
    total_supply_ = amount;
}

void InMemoryTokenLedger::mint(const Address& to, const uint256_t& amount) {
    set_balance(to, balance_of(to) + amount);
    set_total_supply(total_supply_ + amount);
}

void InMemoryTokenLedger::approve(const Address& owner, const Address& spender, const uint256_t& amount) {
    set_allowance(owner, spender, amount);
}

uint256_t InMemoryTokenLedger::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find(owner);
    if (it == allowances_.end()) return 0;
    auto jt = it->second.find(spender);
    return jt == it->second.end() ? uint256_t(0) : jt->second;
}

void InMemoryTokenLedger::move(const Address& from, const Address& to, const uint256_t& amount) {
    const uint256_t have = balance_of(from);
    if (have < amount) {
        throw transfer_failed("ERC20: transfer amount exceeds balance");
    }
    set_balance(from, have - amount);
    set_balance(to, balance_of(to) + amount);
}

void InMemoryTokenLedger::transfer(const Address& caller, const Address& to, const uint256_t& amount) {
    move(caller, to, amount);
}

void InMemoryTokenLedger::transfer_from(const Address& caller, const Address& from, const Address& to,
                                        const uint256_t& amount) {
    const uint256_t allowed = allowance(from, caller);
    if (allowed < amount) {
        throw transfer_failed("ERC20: insufficient allowance");
    }
    move(from, to, amount);
    set_allowance(from, caller, allowed - amount);
}

uint256_t InMemoryTokenLedger::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? uint256_t(0) : it->second;
}

std::size_t InMemoryTokenLedger::checkpoint() {
    marks_.push_back(journal_.size());
    return marks_.size() - 1;
}

void InMemoryTokenLedger::revert_to(std::size_t id) noexcept {
    if (id >= marks_.size()) return;
    const std::size_t mark = marks_[id];
    while (journal_.size() > mark) {
        Undo& u = journal_.back();
        switch (u.slot) {
            case Undo::Slot::Balance:
                if (u.prev) {
                    balances_[u.owner] = *u.prev;
                } else {
                    balances_.erase(u.owner);
                }
                break;
            case Undo::Slot::Allowance: {
                auto& row = allowances_[u.owner];
                if (u.prev) {
                    row[u.spender] = *u.prev;
                } else {
                    row.erase(u.spender);
                    if (row.empty()) allowances_.erase(u.owner);
                }
                break;
            }
            case Undo::Slot::Supply:
                total_supply_ = u.prev ? *u.prev : uint256_t(0);
                break;
        }
        journal_.pop_back();
    }
    marks_.resize(id);
}

void InMemoryTokenLedger::release(std::size_t id) noexcept {
    if (id >= marks_.size()) return;
    marks_.resize(id);
    // Outermost checkpoint gone: nothing can be reverted any more
    if (marks_.empty()) journal_.clear();
}

// -----------------------------------------------------------------------------
// InMemoryReserveBank
// -----------------------------------------------------------------------------

void InMemoryReserveBank::set_balance(const Address& account, const uint256_t& amount) {
    auto it = balances_.find(account);
    if (!marks_.empty()) {
        journal_.emplace_back(account,
                              it == balances_.end() ? std::nullopt : std::optional<uint256_t>(it->second));
    }
    if (it == balances_.end()) {
        balances_.emplace(account, amount);
    } else {
        it->second = amount;
    }
}

void InMemoryReserveBank::deposit(const Address& to, const uint256_t& amount) {
    set_balance(to, balance_of(to) + amount);
}

void InMemoryReserveBank::set_hook(const Address& account, RecipientHook hook) {
    hooks_[account] = std::move(hook);
}

void InMemoryReserveBank::clear_hook(const Address& account) {
    hooks_.erase(account);
}

void InMemoryReserveBank::send(const Address& from, const Address& to, const uint256_t& amount) {
    const uint256_t have = balance_of(from);
    if (have < amount) {
        throw transfer_failed("reserve transfer failed: insufficient balance");
    }

    const std::size_t cp = checkpoint();
    set_balance(from, have - amount);
    set_balance(to, balance_of(to) + amount);

    auto hk = hooks_.find(to);
    if (hk == hooks_.end() || !hk->second) {
        release(cp);
        return;
    }

    // Copy: the hook may replace itself while running
    const RecipientHook hook = hk->second;
    bool accepted = false;
    try {
        accepted = hook(from, amount);
    } catch (...) {
        revert_to(cp);
        throw;
    }
    if (!accepted) {
        revert_to(cp);
        throw transfer_failed("reserve transfer rejected by recipient");
    }
    release(cp);
}

uint256_t InMemoryReserveBank::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? uint256_t(0) : it->second;
}

std::size_t InMemoryReserveBank::checkpoint() {
    marks_.push_back(journal_.size());
    return marks_.size() - 1;
}

void InMemoryReserveBank::revert_to(std::size_t id) noexcept {
    if (id >= marks_.size()) return;
    const std::size_t mark = marks_[id];
    while (journal_.size() > mark) {
        auto& u = journal_.back();
        if (u.second) {
            balances_[u.first] = *u.second;
        } else {
            balances_.erase(u.first);
        }
        journal_.pop_back();
    }
    marks_.resize(id);
}

void InMemoryReserveBank::release(std::size_t id) noexcept {
    if (id >= marks_.size()) return;
    marks_.resize(id);
    if (marks_.empty()) journal_.clear();
}

} // namespace ledger
} // namespace lc
