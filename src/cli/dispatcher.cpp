// Main entry point for the declist CLI with subcommand dispatch
//
// Usage:
//   declist train <training.txt> <decisions.txt>         Learn a decision list
//   declist test <decisions.txt> <test.txt> <out.txt>    Label test documents
//   declist eval <gold.txt> <system.txt> <report.txt>    Score labels against gold

#include "subcommand.hpp"
#include "args.hpp"
#include "declist/version.h"
#include <iostream>
#include <cstring>

int main(int argc, char* argv[]) {
    auto& registry = declist::cli::SubcommandRegistry::instance();

    // Handle no arguments
    if (argc < 2) {
        registry.print_help(argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];

    // Handle --help and --version at top level
    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        registry.print_help(argv[0]);
        return 0;
    }

    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        declist::cli::print_version();
        return 0;
    }

    // Dispatch to subcommand
    if (registry.has_command(first_arg)) {
        return registry.run_command(first_arg, argc - 1, argv + 1);
    }

    // Unknown command
    std::cerr << "Unknown command: " << first_arg << "\n";
    std::cerr << "Run 'declist --help' for usage information.\n";
    return 1;
}
