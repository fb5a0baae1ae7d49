// declist eval: score system labels against gold labels

#include "subcommand.hpp"
#include "args.hpp"
#include "declist/corpus_io.hpp"
#include "declist/evaluator.hpp"
#include "declist/log_utils.hpp"
#include "declist/version.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace declist {
namespace cli {

int cmd_eval(int argc, char* argv[]) {
    EvalOptions opts;
    try {
        opts = parse_eval_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            std::cerr << "Run 'declist eval --help' for usage.\n";
        }
        return e.exit_code();
    }

    auto t_start = std::chrono::steady_clock::now();

    try {
        if (opts.verbose) {
            log_utils::info("declist v" DECLIST_VERSION " eval");
            log_utils::info("Gold: " + opts.gold_file);
            log_utils::info("System: " + opts.system_file);
            log_utils::info("Output: " + opts.output_file);
        }

        const LabelSet gold = read_label_file(opts.gold_file);
        const LabelSet system = read_label_file(opts.system_file);
        const EvaluationResult result = evaluate(gold, system, opts.gold_file, opts.system_file);

        if (!result.accuracy_defined()) {
            log_utils::warn("no documents to evaluate; accuracy reported as 0");
        }
        if (!result.precision_defined()) {
            log_utils::warn("no positive predictions in " + opts.system_file +
                            "; precision reported as 0");
        }
        if (!result.recall_defined()) {
            log_utils::warn("no positive documents in " + opts.gold_file +
                            "; recall reported as 0");
        }

        write_report_file(opts.output_file, result);

        if (opts.verbose) {
            const ConfusionMatrix& c = result.counts;
            std::ostringstream oss;
            oss << "TP=" << c.true_positive << " FP=" << c.false_positive
                << " FN=" << c.false_negative << " TN=" << c.true_negative;
            log_utils::info(oss.str());
            oss.str("");
            oss << std::fixed << std::setprecision(4)
                << "Accuracy " << round_to(result.accuracy(), 4)
                << ", precision " << round_to(result.precision(), 4)
                << ", recall " << round_to(result.recall(), 4);
            log_utils::info(oss.str());
            log_utils::info("Total time: " +
                            log_utils::format_elapsed(t_start, std::chrono::steady_clock::now()));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
    struct EvalRegistrar {
        EvalRegistrar() {
            SubcommandRegistry::instance().register_command(
                "eval",
                "Score system labels against gold labels",
                cmd_eval, 30);
        }
    };
    static EvalRegistrar registrar;
}

}  // namespace cli
}  // namespace declist
