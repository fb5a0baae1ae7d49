#pragma once

#include "declist/label_set.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace declist {

struct ConfusionMatrix {
    size_t true_positive = 0;
    size_t false_positive = 0;
    size_t false_negative = 0;
    size_t true_negative = 0;

    void add(bool gold, bool system) {
        if (system && gold) {
            ++true_positive;
        } else if (system) {
            ++false_positive;
        } else if (gold) {
            ++false_negative;
        } else {
            ++true_negative;
        }
    }

    size_t total() const {
        return true_positive + false_positive + false_negative + true_negative;
    }
};

struct EvaluationRow {
    std::string id;
    bool gold = false;
    bool system = false;
};

/**
 * Comparison of a system labelling against gold.
 *
 * A metric whose denominator is zero (no documents, no system-positive
 * predictions, or no gold-positive documents) is undefined; its value is
 * reported as 0 and the matching *_defined() returns false.
 */
struct EvaluationResult {
    ConfusionMatrix counts;
    std::vector<EvaluationRow> rows;  // gold order

    double accuracy() const;
    double precision() const;
    double recall() const;

    bool accuracy_defined() const { return counts.total() > 0; }
    bool precision_defined() const { return counts.true_positive + counts.false_positive > 0; }
    bool recall_defined() const { return counts.true_positive + counts.false_negative > 0; }
};

/**
 * Compare `system` against `gold`, walking gold in its stored order.
 * Both sets must hold the same ids; a missing id throws std::runtime_error
 * naming the id and the set (gold_name / system_name) it is missing from.
 */
EvaluationResult evaluate(const LabelSet& gold, const LabelSet& system,
                          const std::string& gold_name = "gold labels",
                          const std::string& system_name = "system labels");

// Round half away from zero to `digits` decimal places
double round_to(double value, int digits);

/**
 * Per-id lines "<id> <gold> <system>" followed by
 * "Accuracy: x.xxxx", "Precision: x.xxxx" and "Recall: x.xxxx".
 */
void write_report(std::ostream& os, const EvaluationResult& result);
void write_report_file(const std::string& filename, const EvaluationResult& result);

}  // namespace declist
