// declist train: learn a decision list from labelled documents
//
// Every document is tokenized, negation-scoped and folded into the feature
// table before the next one is read. Scoring and sorting run once the whole
// corpus has been counted.

#include "subcommand.hpp"
#include "args.hpp"
#include "declist/decision_list.hpp"
#include "declist/log_utils.hpp"
#include "declist/trainer.hpp"
#include "declist/version.h"

#include <chrono>
#include <iostream>
#include <sstream>

namespace declist {
namespace cli {

int cmd_train(int argc, char* argv[]) {
    TrainOptions opts;
    try {
        opts = parse_train_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            std::cerr << "Run 'declist train --help' for usage.\n";
        }
        return e.exit_code();
    }

    auto t_start = std::chrono::steady_clock::now();

    try {
        TrainConfig config;
        config.mode = opts.mode;
        config.smoothing = opts.smoothing;

        if (opts.verbose) {
            log_utils::info("declist v" DECLIST_VERSION " train");
            log_utils::info("Input: " + opts.training_file);
            log_utils::info("Output: " + opts.output_file);
            std::ostringstream cfg;
            cfg << "Counting: " << counting_mode_name(config.mode);
            if (config.mode == CountingMode::HYBRID) cfg << " (cap " << config.hybrid_cap << ")";
            cfg << ", smoothing: " << smoothing_name(config.smoothing)
                << ", threshold: " << config.threshold;
            log_utils::info(cfg.str());
        }

        TrainStats stats;
        DecisionList decisions = train_file(opts.training_file, config, &stats);
        auto t_trained = std::chrono::steady_clock::now();

        if (stats.documents == 0) {
            log_utils::warn("no documents in " + opts.training_file);
        }

        const size_t written = write_decision_list_file(opts.output_file, decisions, config.threshold);
        auto t_end = std::chrono::steady_clock::now();

        if (opts.verbose) {
            log_utils::info("Documents: " + log_utils::format_count(stats.documents) +
                            " (" + log_utils::format_count(stats.positive_documents) + " positive, " +
                            log_utils::format_count(stats.negative_documents) + " negative)");
            log_utils::info("Sentences: " + log_utils::format_count(stats.sentences));
            log_utils::info("Features: " + log_utils::format_count(stats.features) +
                            " (" + log_utils::format_elapsed(t_start, t_trained) + ")");
            log_utils::info("Written: " + log_utils::format_count(written) + " decisions to " +
                            opts.output_file);
            log_utils::info("Total time: " + log_utils::format_elapsed(t_start, t_end));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
    struct TrainRegistrar {
        TrainRegistrar() {
            SubcommandRegistry::instance().register_command(
                "train",
                "Learn a decision list from labelled documents",
                cmd_train, 10);
        }
    };
    static TrainRegistrar registrar;
}

}  // namespace cli
}  // namespace declist
