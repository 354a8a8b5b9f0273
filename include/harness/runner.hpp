// Scenario runner - single scenario execution and parallel multi-scenario processing
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "curve/state.hpp"
#include "harness/config.hpp"

namespace lc {
namespace harness {

// Outcome of one scripted action
struct ActionOutcome {
    std::size_t index{0};
    ActionType type{ActionType::Buy};
    Address actor;
    uint64_t ts{0};
    bool ok{false};
    std::string error_kind;
    std::string error_msg;
    curve::TradeResult trade{};   // buy/sell only
};

// Result from running a single scenario
struct ScenarioResult {
    std::string tag;
    std::vector<ActionOutcome> outcomes;

    // Final curve state
    curve::DetailedState final_state{};
    uint256_t graduation_progress{0};
    bool paused{false};
    uint64_t timestamp{0};

    // Final ledger balances
    std::map<Address, uint256_t> reserve_balances;
    std::map<Address, uint256_t> token_balances;

    // Liquidity handed over at graduation
    uint256_t liquidity_tokens{0};
    uint256_t liquidity_reserve{0};

    // Event log (only populated if save_events=true)
    boost::json::array events{};
    std::size_t n_events{0};

    // Echo back the input curve JSON for the params block
    boost::json::object echo_curve{};

    double elapsed_ms{0};
    bool success{false};
    std::string error_msg;

    std::size_t n_failed() const {
        std::size_t n = 0;
        for (const auto& o : outcomes) {
            if (!o.ok) ++n;
        }
        return n;
    }
};

struct RunConfig {
    bool save_events{false};
    bool verbose{false};       // per-action log lines
};

// Run one scenario on a fresh curve with in-memory ledgers
ScenarioResult run_single_scenario(const ScenarioInit& init, const RunConfig& cfg);

// Run multiple scenarios in parallel using a thread pool
std::vector<ScenarioResult> run_scenarios_parallel(
    const std::vector<ScenarioInit>& scenarios,
    const RunConfig& cfg,
    std::size_t n_threads = 0,
    bool progress = true
);

} // namespace harness
} // namespace lc
