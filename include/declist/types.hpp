#pragma once

#include <string>
#include <utility>
#include <vector>

namespace declist {

// Basic corpus types
using Feature = std::string;
using Tokens = std::vector<std::string>;
using Sentences = std::vector<Tokens>;

// Class labels as written in every file format: 1 = positive, 0 = negative
inline char label_char(bool positive) {
    return positive ? '1' : '0';
}

/**
 * One entry of the decision list.
 *
 * During training the counts accumulate per class; scoring then fills
 * classification and log_likelihood exactly once. A reloaded list carries
 * only feature and classification.
 */
struct Decision {
    Feature feature;
    double positive_count = 0.0;
    double negative_count = 0.0;
    double log_likelihood = 0.0;   // |signed score|, valid once scored
    bool classification = false;  // true = positive class
    bool scored = false;

    Decision() = default;
    explicit Decision(Feature f) : feature(std::move(f)) {}
    Decision(Feature f, bool cls) : feature(std::move(f)), classification(cls), scored(true) {}

    void increment(bool positive) {
        if (positive) {
            positive_count += 1.0;
        } else {
            negative_count += 1.0;
        }
    }

    double count(bool positive) const {
        return positive ? positive_count : negative_count;
    }

    // Add the counts of another decision for the same feature
    void merge_counts(const Decision& other) {
        positive_count += other.positive_count;
        negative_count += other.negative_count;
    }
};

using DecisionList = std::vector<Decision>;

// Raw document as read from a corpus file
struct Document {
    std::string id;
    std::string text;
};

// Training document with its known class
struct LabeledDocument {
    std::string id;
    bool positive = false;
    std::string text;
};

}  // namespace declist
