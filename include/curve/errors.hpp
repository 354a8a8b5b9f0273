// Failure taxonomy for curve operations
#pragma once

#include <stdexcept>
#include <string>

namespace lc {
namespace curve {

// Malformed or unsatisfiable request; nothing was mutated
struct invalid_trade : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Per-wallet purchase cap; raised after the diagnostic notification went out
struct purchase_limit_exceeded : std::runtime_error {
    purchase_limit_exceeded() : std::runtime_error("Purchase exceeds 4% limit") {}
};

// Downstream token or reserve movement failed
struct transfer_failed : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// State corruption or programmer error, never recoverable
struct invariant_violation : std::logic_error {
    using std::logic_error::logic_error;
};

struct reentrancy_error : std::runtime_error {
    reentrancy_error() : std::runtime_error("ReentrancyGuard: reentrant call") {}
};

struct trading_paused : std::runtime_error {
    trading_paused() : std::runtime_error("Pausable: paused") {}
};

struct unauthorized : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Short tag for reporting a caught failure (harness output, logs)
inline const char* error_kind(const std::exception& e) {
    if (dynamic_cast<const invalid_trade*>(&e)) return "invalid_trade";
    if (dynamic_cast<const purchase_limit_exceeded*>(&e)) return "purchase_limit_exceeded";
    if (dynamic_cast<const transfer_failed*>(&e)) return "transfer_failed";
    if (dynamic_cast<const invariant_violation*>(&e)) return "invariant_violation";
    if (dynamic_cast<const reentrancy_error*>(&e)) return "reentrancy_error";
    if (dynamic_cast<const trading_paused*>(&e)) return "trading_paused";
    if (dynamic_cast<const unauthorized*>(&e)) return "unauthorized";
    return "error";
}

} // namespace curve
} // namespace lc
