// Scenario runner implementation

#include "harness/runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

#include "core/common.hpp"
#include "core/json_utils.hpp"
#include "curve/bonding_curve.hpp"
#include "curve/constants.hpp"
#include "events/sink.hpp"
#include "ledger/memory_ledger.hpp"

namespace lc {
namespace harness {

namespace {

void log_outcome(const std::string& tag, const ActionOutcome& o) {
    std::ostringstream oss;
    oss << "[" << tag << "] #" << o.index << " " << action_name(o.type);
    if (!o.actor.empty()) oss << " " << o.actor;
    if (o.ok) {
        if (o.type == ActionType::Buy || o.type == ActionType::Sell) {
            oss << " reserve=" << to_units_str(o.trade.reserve_amount)
                << " tokens=" << to_units_str(o.trade.token_amount)
                << " fee=" << to_units_str(o.trade.fee)
                << " price=" << to_wei_str(o.trade.new_price);
            if (o.trade.clamped) oss << " (clamped)";
            if (o.trade.graduated) oss << " -> graduated";
        }
    } else {
        oss << " failed: " << o.error_kind << ": " << o.error_msg;
    }
    log_info(oss.str());
}

} // namespace

ScenarioResult run_single_scenario(const ScenarioInit& init, const RunConfig& cfg) {
    ScenarioResult result;
    result.tag = init.tag;
    result.echo_curve = init.echo_curve;

    auto t_start = std::chrono::high_resolution_clock::now();

    try {
        const auto& cc = init.curve;

        ledger::InMemoryTokenLedger token(init.tag);
        ledger::InMemoryReserveBank bank;
        ledger::RetainedLiquidity liquidity;
        events::EventRecorder recorder(cfg.save_events);

        // Factory side of a launch: full issuance to the curve, curve registered with the hub
        token.mint(cc.curve, curve::TOTAL_SUPPLY());
        recorder.authorize(cc.curve);
        for (const auto& [who, amount] : init.balances) {
            bank.deposit(who, amount);
        }

        curve::BondingCurve market(cc, token, bank, &recorder, &liquidity);
        market.set_block_timestamp(init.start_ts);

        result.outcomes.reserve(init.actions.size());
        for (std::size_t i = 0; i < init.actions.size(); ++i) {
            const auto& act = init.actions[i];

            ActionOutcome o;
            o.index = i;
            o.type = act.type;
            o.actor = act.actor;
            o.ts = market.block_timestamp();

            try {
                switch (act.type) {
                    case ActionType::Buy:
                        o.trade = market.buy(act.actor, act.amount);
                        break;
                    case ActionType::Sell: {
                        const uint256_t units = act.sell_all ? token.balance_of(act.actor) : act.amount;
                        token.approve(act.actor, cc.curve, units);
                        o.trade = market.sell(act.actor, units);
                        break;
                    }
                    case ActionType::Pause:
                        market.pause(act.actor);
                        break;
                    case ActionType::Unpause:
                        market.unpause(act.actor);
                        break;
                    case ActionType::Advance:
                        market.set_block_timestamp(market.block_timestamp() + act.seconds);
                        break;
                }
                o.ok = true;
            } catch (const std::exception& e) {
                o.ok = false;
                o.error_kind = curve::error_kind(e);
                o.error_msg = e.what();
            }

            if (cfg.verbose) log_outcome(init.tag, o);
            result.outcomes.push_back(std::move(o));
        }

        // Capture final state
        result.final_state = market.detailed_state();
        result.graduation_progress = market.graduation_progress();
        result.paused = market.paused();
        result.timestamp = market.block_timestamp();
        result.reserve_balances = bank.balances();
        result.token_balances = token.balances();
        result.liquidity_tokens = liquidity.token_amount_total;
        result.liquidity_reserve = liquidity.reserve_amount_total;
        result.n_events = recorder.size();
        if (cfg.save_events) {
            result.events = recorder.to_json();
        }
        result.success = true;

    } catch (const std::exception& e) {
        result.success = false;
        result.error_msg = e.what();
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    return result;
}

std::vector<ScenarioResult> run_scenarios_parallel(
    const std::vector<ScenarioInit>& scenarios,
    const RunConfig& cfg,
    std::size_t n_threads,
    bool progress
) {
    if (n_threads == 0) {
        n_threads = std::thread::hardware_concurrency();
        if (n_threads == 0) n_threads = 1;
    }

    const std::size_t n_jobs = scenarios.size();
    std::vector<ScenarioResult> results(n_jobs);

    if (n_jobs == 0) {
        return results;
    }

    auto run_job = [&](std::size_t i) {
        if (progress) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "dispatch job " << (i + 1) << "/" << n_jobs << " (" << scenarios[i].tag << ")\n";
        }

        results[i] = run_single_scenario(scenarios[i], cfg);

        if (progress) {
            std::lock_guard<std::mutex> lock(io_mu);
            std::cout << "finished job " << (i + 1) << "/" << n_jobs
                      << ", time: " << std::fixed << std::setprecision(4)
                      << (results[i].elapsed_ms / 1000.0) << " s\n";
        }
    };

    // For single scenario or single thread, run sequentially
    if (n_jobs == 1 || n_threads == 1) {
        for (std::size_t i = 0; i < n_jobs; ++i) {
            run_job(i);
        }
        return results;
    }

    // Thread pool with work stealing via atomic index
    std::atomic<std::size_t> next_idx{0};

    auto worker = [&]() {
        while (true) {
            const std::size_t i = next_idx.fetch_add(1);
            if (i >= n_jobs) break;
            run_job(i);
        }
    };

    const std::size_t actual_threads = std::min(n_threads, n_jobs);
    std::vector<std::thread> threads;
    threads.reserve(actual_threads);

    for (std::size_t t = 0; t < actual_threads; ++t) {
        threads.emplace_back(worker);
    }

    for (auto& th : threads) {
        th.join();
    }

    return results;
}

} // namespace harness
} // namespace lc
