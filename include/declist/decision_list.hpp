#pragma once

#include "declist/types.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace declist {

// Column widths of the decision-list text format
constexpr int FEATURE_WIDTH = 40;
constexpr int SCORE_WIDTH = 8;
constexpr int CLASS_WIDTH = 4;
constexpr int SCORE_PRECISION = 4;

/**
 * Order decisions by log-likelihood, highest first.
 * Stable: equal scores keep their arrival order. Throws std::logic_error
 * if any decision has not been scored.
 */
void sort_decisions(DecisionList& decisions);

/**
 * Write decisions with log_likelihood >= threshold, one per line:
 *
 *   <feature, left-justified, 40> <score, 8.4f> <class, 4>
 *
 * The list is expected sorted, so writing stops at the first decision
 * below the threshold. Returns the number of lines written.
 */
size_t write_decision_list(std::ostream& os, const DecisionList& decisions, double threshold);
size_t write_decision_list_file(const std::string& filename, const DecisionList& decisions,
                                double threshold);

/**
 * Parse one decision-list line. The last two fields are the score and the
 * class digit; everything before them, trailing blanks trimmed, is the
 * feature. The score is validated but not kept.
 */
bool parse_decision_line(std::string_view line, Decision& out);

/**
 * Reload a written list in file order; the producer's order is trusted.
 * Throws std::runtime_error naming the file and line on malformed input.
 */
DecisionList read_decision_list(const std::string& filename);

}  // namespace declist
