// In-memory ledgers used by the simulation harness and the tests
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/numeric_types.hpp"
#include "ledger/interfaces.hpp"

namespace lc {
namespace ledger {

// ERC20-style balances with allowances
class InMemoryTokenLedger : public TokenLedger {
public:
    explicit InMemoryTokenLedger(std::string symbol = "TOKEN") : symbol_(std::move(symbol)) {}

    const std::string& symbol() const { return symbol_; }
    const uint256_t& total_supply() const { return total_supply_; }
    std::size_t open_checkpoints() const { return marks_.size(); }

    // Issuance happens once at launch (factory side)
    void mint(const Address& to, const uint256_t& amount);
    void approve(const Address& owner, const Address& spender, const uint256_t& amount);
    uint256_t allowance(const Address& owner, const Address& spender) const;

    void transfer(const Address& caller, const Address& to, const uint256_t& amount) override;
    void transfer_from(const Address& caller, const Address& from, const Address& to,
                       const uint256_t& amount) override;
    uint256_t balance_of(const Address& account) const override;

    std::size_t checkpoint() override;
    void revert_to(std::size_t id) noexcept override;
    void release(std::size_t id) noexcept override;

    const std::map<Address, uint256_t>& balances() const { return balances_; }

private:
    // Prior value of one touched slot; nullopt means the slot did not exist
    struct Undo {
        enum class Slot { Balance, Allowance, Supply };
        Slot slot;
        Address owner;
        Address spender;
        std::optional<uint256_t> prev;
    };

    void move(const Address& from, const Address& to, const uint256_t& amount);
    void set_balance(const Address& account, const uint256_t& amount);
    void set_allowance(const Address& owner, const Address& spender, const uint256_t& amount);
    void set_total_supply(const uint256_t& amount);

    std::string symbol_;
    std::map<Address, uint256_t> balances_;
    std::map<Address, std::map<Address, uint256_t>> allowances_;
    uint256_t total_supply_{0};

    // Undo journal; marks_ holds the journal length at each open checkpoint
    std::vector<Undo> journal_;
    std::vector<std::size_t> marks_;
};

// Native-coin balances. Recipients can carry a hook that runs after the value
// is credited (recipient code); returning false rejects the transfer.
class InMemoryReserveBank : public ReserveBank {
public:
    using RecipientHook = std::function<bool(const Address& from, const uint256_t& amount)>;

    void deposit(const Address& to, const uint256_t& amount);
    void set_hook(const Address& account, RecipientHook hook);
    void clear_hook(const Address& account);

    void send(const Address& from, const Address& to, const uint256_t& amount) override;
    uint256_t balance_of(const Address& account) const override;

    std::size_t checkpoint() override;
    void revert_to(std::size_t id) noexcept override;
    void release(std::size_t id) noexcept override;

    const std::map<Address, uint256_t>& balances() const { return balances_; }
    std::size_t open_checkpoints() const { return marks_.size(); }

private:
    void set_balance(const Address& account, const uint256_t& amount);

    std::map<Address, uint256_t> balances_;
    std::map<Address, RecipientHook> hooks_;

    // Prior balances of touched accounts (nullopt: account did not exist)
    std::vector<std::pair<Address, std::optional<uint256_t>>> journal_;
    std::vector<std::size_t> marks_;
};

// Graduation liquidity that stays parked on the curve; records what it was handed
class RetainedLiquidity : public LiquidityProvisioner {
public:
    void provide(const Address& token, const uint256_t& token_amount,
                 const uint256_t& reserve_amount) override {
        last_token = token;
        token_amount_total += token_amount;
        reserve_amount_total += reserve_amount;
        ++calls;
    }

    Address last_token;
    uint256_t token_amount_total{0};
    uint256_t reserve_amount_total{0};
    std::size_t calls{0};
};

} // namespace ledger
} // namespace lc
