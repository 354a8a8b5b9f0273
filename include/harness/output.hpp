// JSON output writer for harness results
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "harness/runner.hpp"

namespace lc {
namespace harness {

// Final curve state of one scenario
boost::json::object final_state_json(const ScenarioResult& r);

// Per-action outcomes of one scenario
boost::json::array outcomes_json(const ScenarioResult& r);

// Summary counters of one scenario
boost::json::object summary_json(const ScenarioResult& r);

// Output format for the entire run
boost::json::object build_output_json(
    const std::vector<ScenarioResult>& results,
    const std::string& data_path,
    std::size_t n_threads,
    double read_ms,
    double exec_ms
);

// Write results to JSON file
bool write_results_json(
    const std::string& output_path,
    const std::vector<ScenarioResult>& results,
    const std::string& data_path,
    std::size_t n_threads,
    double read_ms,
    double exec_ms
);

} // namespace harness
} // namespace lc
