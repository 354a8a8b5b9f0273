// JSON output writer implementation

#include "harness/output.hpp"

#include <fstream>

#include "core/json_utils.hpp"
#include "curve/constants.hpp"
#include "curve/state.hpp"

namespace lc {
namespace harness {

namespace json = boost::json;

namespace {

json::object balances_json(const std::map<Address, uint256_t>& m) {
    json::object o;
    for (const auto& [who, amount] : m) {
        o[who] = to_wei_str(amount);
    }
    return o;
}

} // namespace

json::object final_state_json(const ScenarioResult& r) {
    const auto& s = r.final_state;
    json::object o;
    o["current_price"] = to_wei_str(s.current_price);
    o["total_raised"] = to_wei_str(s.total_raised);
    o["current_reserves"] = to_wei_str(s.current_reserves);
    o["units_sold"] = to_wei_str(s.units_sold);
    o["graduated"] = s.graduated;
    o["phase"] = curve::phase_name(s.graduated ? curve::Phase::Graduated : curve::Phase::Trading);
    o["graduation_progress"] = to_wei_str(r.graduation_progress);
    o["paused"] = r.paused;
    o["timestamp"] = r.timestamp;
    o["liquidity_tokens"] = to_wei_str(r.liquidity_tokens);
    o["liquidity_reserve"] = to_wei_str(r.liquidity_reserve);
    o["reserve_balances"] = balances_json(r.reserve_balances);
    o["token_balances"] = balances_json(r.token_balances);
    return o;
}

json::array outcomes_json(const ScenarioResult& r) {
    json::array arr;
    arr.reserve(r.outcomes.size());
    for (const auto& oc : r.outcomes) {
        json::object o;
        o["index"] = static_cast<uint64_t>(oc.index);
        o["type"] = action_name(oc.type);
        if (!oc.actor.empty()) o["actor"] = oc.actor;
        o["ts"] = oc.ts;
        o["ok"] = oc.ok;
        if (!oc.ok) {
            o["error_kind"] = oc.error_kind;
            o["error"] = oc.error_msg;
        } else if (oc.type == ActionType::Buy || oc.type == ActionType::Sell) {
            o["reserve_amount"] = to_wei_str(oc.trade.reserve_amount);
            o["token_amount"] = to_wei_str(oc.trade.token_amount);
            o["fee"] = to_wei_str(oc.trade.fee);
            o["new_price"] = to_wei_str(oc.trade.new_price);
            o["clamped"] = oc.trade.clamped;
            o["graduated"] = oc.trade.graduated;
        }
        arr.push_back(std::move(o));
    }
    return arr;
}

json::object summary_json(const ScenarioResult& r) {
    uint256_t bought = 0, sold = 0, fees = 0, spent = 0, received = 0;
    uint64_t buys = 0, sells = 0;
    for (const auto& oc : r.outcomes) {
        if (!oc.ok) continue;
        if (oc.type == ActionType::Buy) {
            ++buys;
            bought += oc.trade.token_amount;
            spent += oc.trade.reserve_amount;
            fees += oc.trade.fee;
        } else if (oc.type == ActionType::Sell) {
            ++sells;
            sold += oc.trade.token_amount;
            received += oc.trade.reserve_amount;
            fees += oc.trade.fee;
        }
    }

    json::object s;
    s["actions"] = static_cast<uint64_t>(r.outcomes.size());
    s["failed"] = static_cast<uint64_t>(r.n_failed());
    s["buys"] = buys;
    s["sells"] = sells;
    s["tokens_bought"] = to_wei_str(bought);
    s["tokens_sold"] = to_wei_str(sold);
    s["reserve_spent"] = to_wei_str(spent);
    s["reserve_received"] = to_wei_str(received);
    s["trading_fees"] = to_wei_str(fees);
    s["events"] = static_cast<uint64_t>(r.n_events);
    s["scenario_exec_ms"] = r.elapsed_ms;
    return s;
}

json::object build_output_json(
    const std::vector<ScenarioResult>& results,
    const std::string& data_path,
    std::size_t n_threads,
    double read_ms,
    double exec_ms
) {
    // Metadata
    json::object meta;
    meta["scenarios_file"] = data_path;
    meta["scenarios"] = static_cast<uint64_t>(results.size());
    meta["threads"] = static_cast<uint64_t>(n_threads);
    meta["read_ms"] = read_ms;
    meta["exec_ms"] = exec_ms;
    meta["version"] = curve::version();

    json::array runs;
    runs.reserve(results.size());

    for (const auto& r : results) {
        json::object run;
        run["tag"] = r.tag;
        run["success"] = r.success;
        if (!r.success) {
            run["error"] = r.error_msg;
        } else {
            run["result"] = summary_json(r);
            run["final_state"] = final_state_json(r);
            run["outcomes"] = outcomes_json(r);
        }

        json::object params;
        params["curve"] = r.echo_curve;
        run["params"] = params;

        if (!r.events.empty()) {
            run["events"] = r.events;
        }

        runs.push_back(std::move(run));
    }

    json::object O;
    O["metadata"] = meta;
    O["runs"] = runs;
    return O;
}

bool write_results_json(
    const std::string& output_path,
    const std::vector<ScenarioResult>& results,
    const std::string& data_path,
    std::size_t n_threads,
    double read_ms,
    double exec_ms
) {
    auto O = build_output_json(results, data_path, n_threads, read_ms, exec_ms);

    std::ofstream of(output_path);
    if (!of) {
        return false;
    }

    of << json::serialize(O) << '\n';
    return of.good();
}

} // namespace harness
} // namespace lc
