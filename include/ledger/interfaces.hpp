// Collaborator seams: issued-token ledger, reserve-asset transfers, liquidity sink
#pragma once

#include <cstddef>

#include "core/numeric_types.hpp"

namespace lc {
namespace ledger {

// Checkpoint/rollback support so a trade can revert every ledger it touched.
// Checkpoints nest LIFO; revert_to and release both drop the checkpoint.
class Journaled {
public:
    virtual ~Journaled() = default;

    virtual std::size_t checkpoint() = 0;
    virtual void revert_to(std::size_t id) noexcept = 0;
    virtual void release(std::size_t id) noexcept = 0;
};

// Fungible balance ledger of the issued token.
// caller is the account on whose behalf the call is made (msg.sender).
// Failures throw curve::transfer_failed; no partial transfers.
class TokenLedger : public Journaled {
public:
    virtual void transfer(const Address& caller, const Address& to, const uint256_t& amount) = 0;
    virtual void transfer_from(const Address& caller, const Address& from, const Address& to,
                               const uint256_t& amount) = 0;
    virtual uint256_t balance_of(const Address& account) const = 0;
};

// Native value-transfer primitive for the reserve asset.
// A recipient may reject (transfer_failed) or run code of its own before accepting.
class ReserveBank : public Journaled {
public:
    virtual void send(const Address& from, const Address& to, const uint256_t& amount) = 0;
    virtual uint256_t balance_of(const Address& account) const = 0;
};

// Liquidity seeding at graduation (external pool integration point).
// Runs inside the graduating buy; throwing reverts that buy.
class LiquidityProvisioner {
public:
    virtual ~LiquidityProvisioner() = default;

    virtual void provide(const Address& token, const uint256_t& token_amount,
                         const uint256_t& reserve_amount) = 0;
};

} // namespace ledger
} // namespace lc
