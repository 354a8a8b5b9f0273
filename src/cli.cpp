// CLI argument parsing implementation

#include "harness/cli.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

#include "core/json_utils.hpp"

namespace lc {
namespace harness {

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name
              << " <scenarios.json> <output.json>\n"
              << "       [--threads N | -n N] [--save-events] [--quiet]\n"
              << "Environment: LC_VERBOSE=1 logs every action, LC_THREADS sets the default thread count\n";
}

CliArgs parse_cli(int argc, char* argv[]) {
    CliArgs args{};
    args.n_threads = static_cast<std::size_t>(env_u64("LC_THREADS", args.n_threads));

    if (argc < 3) {
        args.valid = false;
        args.error_msg = "Not enough arguments (need scenarios.json, output.json)";
        return args;
    }

    args.scenarios_path = argv[1];
    args.out_path = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--threads" || arg == "-n") && i + 1 < argc) {
            try {
                args.n_threads = static_cast<std::size_t>(std::stoll(argv[++i]));
            } catch (const std::exception&) {
                args.valid = false;
                args.error_msg = std::string("Bad thread count: ") + argv[i];
                return args;
            }
        } else if (arg == "--save-events") {
            args.save_events = true;
        } else if (arg == "--quiet" || arg == "-q") {
            args.quiet = true;
        } else {
            std::cerr << "Warning: ignoring unknown argument " << arg << "\n";
        }
    }

    if (args.n_threads == 0) args.n_threads = 1;

    args.valid = true;
    return args;
}

} // namespace harness
} // namespace lc
