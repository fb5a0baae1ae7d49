#pragma once

#include "declist/config.hpp"
#include "declist/feature_table.hpp"
#include "declist/types.hpp"

namespace declist {

/**
 * Signed log2 ratio of positive to negative evidence.
 *
 * Laplace: a zero count becomes 1 and the other side gains 1; features
 * seen in both classes are left unsmoothed. Quadratic: the zero count
 * becomes 1 and the other side c becomes (c-1)^2 + 1.
 */
double signed_log_likelihood(double positive, double negative,
                             Smoothing smoothing = Smoothing::LAPLACE);

/**
 * Score one decision after counting has finished.
 *
 * Two steps on the record: the class is taken from the sign of the signed
 * score (score > 0 is positive, 0 is negative), then log_likelihood is
 * overwritten with its magnitude. Throws std::logic_error if the decision
 * was already scored.
 */
void score_decision(Decision& decision, Smoothing smoothing = Smoothing::LAPLACE);

// Score every decision in the table
void score_all(FeatureTable& table, Smoothing smoothing = Smoothing::LAPLACE);

}  // namespace declist
