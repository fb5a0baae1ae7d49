#ifndef DECLIST_CLI_ARGS_HPP
#define DECLIST_CLI_ARGS_HPP

#include "declist/config.hpp"

#include <exception>
#include <string>
#include <utility>

namespace declist {
namespace cli {

// Thrown by the parsers when the command should stop before running.
// exit_code 0 for --help and wrong argument counts, 1 for invalid options.
class ParseArgsExit : public std::exception {
public:
    explicit ParseArgsExit(int exit_code, std::string message = {})
        : exit_code_(exit_code), message_(std::move(message)) {}

    int exit_code() const noexcept { return exit_code_; }
    const std::string& message() const noexcept { return message_; }
    const char* what() const noexcept override { return message_.c_str(); }

private:
    int exit_code_;
    std::string message_;
};

struct TrainOptions {
    std::string training_file;
    std::string output_file;
    CountingMode mode = CountingMode::PRESENCE;
    Smoothing smoothing = Smoothing::LAPLACE;
    bool verbose = false;
};

struct TestOptions {
    std::string decision_list_file;
    std::string test_file;
    std::string output_file;
    int num_threads = 0;  // 0 = OpenMP default
    bool verbose = false;
};

struct EvalOptions {
    std::string gold_file;
    std::string system_file;
    std::string output_file;
    bool verbose = false;
};

// Print version string to stdout
void print_version();

// Per-command usage to stdout
void print_train_usage();
void print_test_usage();
void print_eval_usage();

// "frequency"/"f", "presence"/"p", "hybrid"/"h"; throws ParseArgsExit(1) otherwise
CountingMode parse_counting_mode(const std::string& value);

// "laplace", "quadratic"; throws ParseArgsExit(1) otherwise
Smoothing parse_smoothing(const std::string& value);

// argv[0] is the subcommand name. Each parser:
//   - throws ParseArgsExit(0) after printing usage for -h/--help
//   - throws ParseArgsExit(0) after printing usage for a wrong positional count
//   - throws ParseArgsExit(1, message) for unknown options or bad values
TrainOptions parse_train_args(int argc, char* argv[]);
TestOptions parse_test_args(int argc, char* argv[]);
EvalOptions parse_eval_args(int argc, char* argv[]);

}  // namespace cli
}  // namespace declist

#endif  // DECLIST_CLI_ARGS_HPP
