// Scenario configuration parsing
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <boost/json.hpp>

#include "core/numeric_types.hpp"
#include "curve/bonding_curve.hpp"

namespace lc {
namespace harness {

enum class ActionType {
    Buy,
    Sell,
    Pause,
    Unpause,
    Advance,
};

const char* action_name(ActionType t);

// One scripted call against the curve
struct ScenarioAction {
    ActionType type{ActionType::Buy};
    Address actor;             // trader for buy/sell, caller for pause/unpause
    uint256_t amount{0};       // buy: reserve in; sell: token units
    bool sell_all{false};      // sell: "amount": "all" sells the actor's whole balance
    uint64_t seconds{0};       // advance: clock step
};

// Launch parameters, funded wallets and the action script of one scenario
struct ScenarioInit {
    std::string tag;
    curve::CurveConfig curve;
    uint64_t start_ts{1700000000ULL};
    std::vector<std::pair<Address, uint256_t>> balances;
    std::vector<ScenarioAction> actions;

    // Echo back the input curve JSON for the params block
    boost::json::object echo_curve{};
};

// Parse a single scenario entry
// Entry format: { "tag": "...", "curve": {...}, "balances": {...}, "actions": [...] }
ScenarioInit parse_scenario_entry(const boost::json::object& entry);

// Parse every scenario in a document
// Supports formats:
// - { "scenarios": [ {...}, {...} ] }
// - { "curve": {...}, ... }   (single scenario)
// - [ {...}, {...} ]
std::vector<ScenarioInit> parse_scenarios(const boost::json::value& root);

// Load all scenarios from a JSON file
std::vector<ScenarioInit> load_scenarios(const std::string& path);

} // namespace harness
} // namespace lc
