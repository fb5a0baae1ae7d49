#include "declist/evaluator.hpp"
#include "declist/corpus_io.hpp"
#include "declist/types.hpp"

#include <cmath>
#include <iomanip>
#include <stdexcept>

namespace declist {

namespace {

double ratio(size_t num, size_t den) {
    return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den);
}

}  // namespace

double EvaluationResult::accuracy() const {
    return ratio(counts.true_positive + counts.true_negative, counts.total());
}

double EvaluationResult::precision() const {
    return ratio(counts.true_positive, counts.true_positive + counts.false_positive);
}

double EvaluationResult::recall() const {
    return ratio(counts.true_positive, counts.true_positive + counts.false_negative);
}

EvaluationResult evaluate(const LabelSet& gold, const LabelSet& system,
                          const std::string& gold_name, const std::string& system_name) {
    EvaluationResult result;
    result.rows.reserve(gold.size());

    for (const auto& [id, gold_label] : gold) {
        const std::optional<bool> system_label = system.get(id);
        if (!system_label) {
            throw std::runtime_error("document id '" + id + "' from " + gold_name +
                                     " is missing from " + system_name);
        }
        result.counts.add(gold_label, *system_label);
        result.rows.push_back({id, gold_label, *system_label});
    }

    // Every gold id was found, so any surplus means system has extra ids
    if (system.size() != gold.size()) {
        for (const auto& entry : system) {
            if (!gold.contains(entry.first)) {
                throw std::runtime_error("document id '" + entry.first + "' from " + system_name +
                                         " is missing from " + gold_name);
            }
        }
    }
    return result;
}

double round_to(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

void write_report(std::ostream& os, const EvaluationResult& result) {
    for (const EvaluationRow& row : result.rows) {
        os << row.id << ' ' << label_char(row.gold) << ' ' << label_char(row.system) << '\n';
    }
    os << std::fixed << std::setprecision(4);
    os << "Accuracy: " << round_to(result.accuracy(), 4) << '\n';
    os << "Precision: " << round_to(result.precision(), 4) << '\n';
    os << "Recall: " << round_to(result.recall(), 4) << '\n';
}

void write_report_file(const std::string& filename, const EvaluationResult& result) {
    OutputFile out(filename);
    write_report(out.stream(), result);
    out.close();
}

}  // namespace declist
