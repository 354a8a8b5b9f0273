// CLI argument parsing
#pragma once

#include <cstddef>
#include <string>
#include <thread>

namespace lc {
namespace harness {

struct CliArgs {
    // Positional arguments
    std::string scenarios_path;
    std::string out_path;

    // Options
    std::size_t n_threads{std::thread::hardware_concurrency()};
    bool save_events{false};   // include the event log of every scenario in the output
    bool quiet{false};         // no job progress lines

    // Validation
    bool valid{false};
    std::string error_msg;
};

// Parse command line arguments
// Returns CliArgs with valid=true on success, valid=false with error_msg on failure
CliArgs parse_cli(int argc, char* argv[]);

// Print usage message
void print_usage(const char* prog_name);

} // namespace harness
} // namespace lc
