#include "args.hpp"
#include "declist/version.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace declist {
namespace cli {

namespace {

bool is_option(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

void check_positional_count(const std::vector<std::string>& positional, size_t expected,
                            void (*usage)()) {
    if (positional.size() != expected) {
        std::cout << "Incorrect number of arguments!\n\n";
        usage();
        throw ParseArgsExit(0);
    }
}

}  // namespace

void print_version() {
    std::cout << "declist " << DECLIST_VERSION << "\n";
}

void print_train_usage() {
    std::cout << "Usage: declist train <training-file> <output-file> [options]\n\n";
    std::cout << "Learn a decision list from labelled documents ('<id> <0|1> <text>' per line,\n";
    std::cout << "plain or .gz) and write it in descending log-likelihood order.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -m, --mode <mode>        Feature counting: frequency, presence, hybrid\n";
    std::cout << "                           (or f, p, h; default: presence)\n";
    std::cout << "  --smoothing <name>       Zero-count smoothing: laplace, quadratic\n";
    std::cout << "                           (default: laplace)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
}

void print_test_usage() {
    std::cout << "Usage: declist test <decision-list> <test-file> <output-file> [options]\n\n";
    std::cout << "Label documents ('<id> __ <text>' per line) with the first matching\n";
    std::cout << "decision; documents matching nothing are labelled 0.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -t, --threads <int>      Number of threads, 0 = auto (default: 0)\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
}

void print_eval_usage() {
    std::cout << "Usage: declist eval <gold-file> <system-file> <output-file> [options]\n\n";
    std::cout << "Compare system labels against gold labels ('<id> <0|1>' per line) and\n";
    std::cout << "report accuracy, precision and recall.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
}

CountingMode parse_counting_mode(const std::string& value) {
    if (value == "frequency" || value == "f") return CountingMode::FREQUENCY;
    if (value == "presence" || value == "p") return CountingMode::PRESENCE;
    if (value == "hybrid" || value == "h") return CountingMode::HYBRID;
    throw ParseArgsExit(1, "Error: Unknown counting mode '" + value + "'");
}

Smoothing parse_smoothing(const std::string& value) {
    if (value == "laplace") return Smoothing::LAPLACE;
    if (value == "quadratic") return Smoothing::QUADRATIC;
    throw ParseArgsExit(1, "Error: Unknown smoothing '" + value + "'");
}

TrainOptions parse_train_args(int argc, char* argv[]) {
    TrainOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_train_usage();
            throw ParseArgsExit(0);
        } else if (arg == "-m" || arg == "--mode") {
            opts.mode = parse_counting_mode(require_value(arg));
        } else if (arg == "--smoothing") {
            opts.smoothing = parse_smoothing(require_value(arg));
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (is_option(arg)) {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    check_positional_count(positional, 2, print_train_usage);
    opts.training_file = positional[0];
    opts.output_file = positional[1];
    return opts;
}

TestOptions parse_test_args(int argc, char* argv[]) {
    TestOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const std::logic_error&) {
                // std::invalid_argument / std::out_of_range from stoi
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_test_usage();
            throw ParseArgsExit(0);
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 0) {
                throw ParseArgsExit(1, "Error: --threads must be >= 0");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (is_option(arg)) {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    check_positional_count(positional, 3, print_test_usage);
    opts.decision_list_file = positional[0];
    opts.test_file = positional[1];
    opts.output_file = positional[2];
    return opts;
}

EvalOptions parse_eval_args(int argc, char* argv[]) {
    EvalOptions opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_eval_usage();
            throw ParseArgsExit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (is_option(arg)) {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    check_positional_count(positional, 3, print_eval_usage);
    opts.gold_file = positional[0];
    opts.system_file = positional[1];
    opts.output_file = positional[2];
    return opts;
}

}  // namespace cli
}  // namespace declist
