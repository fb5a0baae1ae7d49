#include "declist/scorer.hpp"

#include <cmath>
#include <stdexcept>

namespace declist {

namespace {

double laplace(double pos, double neg) {
    double total;
    if (pos == 0.0) {
        total = neg + 2.0;
        return std::log2((1.0 / total) / ((neg + 1.0) / total));
    }
    if (neg == 0.0) {
        total = pos + 2.0;
        return std::log2(((pos + 1.0) / total) / (1.0 / total));
    }
    total = pos + neg;
    return std::log2((pos / total) / (neg / total));
}

double quadratic(double pos, double neg) {
    if (pos == 0.0) {
        pos = 1.0;
        neg = (neg - 1.0) * (neg - 1.0) + 1.0;
    } else if (neg == 0.0) {
        pos = (pos - 1.0) * (pos - 1.0) + 1.0;
        neg = 1.0;
    }
    const double total = pos + neg;
    return std::log2((pos / total) / (neg / total));
}

}  // namespace

double signed_log_likelihood(double positive, double negative, Smoothing smoothing) {
    switch (smoothing) {
        case Smoothing::LAPLACE: return laplace(positive, negative);
        case Smoothing::QUADRATIC: return quadratic(positive, negative);
    }
    throw std::invalid_argument("unknown smoothing");
}

void score_decision(Decision& decision, Smoothing smoothing) {
    if (decision.scored) {
        throw std::logic_error("decision already scored: " + decision.feature);
    }

    const double score = signed_log_likelihood(
        decision.positive_count, decision.negative_count, smoothing);

    decision.classification = score > 0.0;
    decision.log_likelihood = std::fabs(score);
    decision.scored = true;
}

void score_all(FeatureTable& table, Smoothing smoothing) {
    for (Decision& d : table) {
        score_decision(d, smoothing);
    }
}

}  // namespace declist
