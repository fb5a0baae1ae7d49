#pragma once

#include "declist/config.hpp"
#include "declist/label_set.hpp"
#include "declist/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace declist {

/**
 * First-match decision-list classifier.
 *
 * The list is scanned in stored order (highest confidence first) and the
 * class of the first feature found in the document wins. A document with
 * no matching feature gets config.default_class.
 */
class Classifier {
public:
    static constexpr size_t NO_MATCH = static_cast<size_t>(-1);

    explicit Classifier(DecisionList decisions, ClassifierConfig config = {});

    /**
     * Index of the first decision whose feature occurs in `rendered`
     * (as produced by render_for_matching), or NO_MATCH.
     */
    size_t first_match(const std::string& rendered) const;

    // Classify an already rendered document
    bool classify(const std::string& rendered) const;

    // Tokenize, negation-scope, render and classify raw text
    bool classify_text(std::string_view text) const;

    /**
     * Classify a batch of documents. Documents are independent, so with
     * OpenMP the batch is split across `num_threads` threads (0 = runtime
     * default). Output order follows input order.
     */
    LabelSet classify_all(const std::vector<Document>& documents, int num_threads = 0) const;

    size_t size() const { return decisions_.size(); }

private:
    DecisionList decisions_;
    std::vector<std::string> patterns_;  // " feature " per decision
    ClassifierConfig config_;
};

}  // namespace declist
