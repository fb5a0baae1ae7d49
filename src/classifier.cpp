#include "declist/classifier.hpp"
#include "declist/tokenizer.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace declist {

Classifier::Classifier(DecisionList decisions, ClassifierConfig config)
    : decisions_(std::move(decisions)), config_(std::move(config)) {
    patterns_.reserve(decisions_.size());
    for (const Decision& d : decisions_) {
        patterns_.push_back(" " + d.feature + " ");
    }
}

size_t Classifier::first_match(const std::string& rendered) const {
    for (size_t i = 0; i < patterns_.size(); ++i) {
        if (rendered.find(patterns_[i]) != std::string::npos) {
            return i;
        }
    }
    return NO_MATCH;
}

bool Classifier::classify(const std::string& rendered) const {
    const size_t idx = first_match(rendered);
    return idx == NO_MATCH ? config_.default_class : decisions_[idx].classification;
}

bool Classifier::classify_text(std::string_view text) const {
    return classify(render_for_matching(preprocess_sentences(text, config_.tokenizer)));
}

LabelSet Classifier::classify_all(const std::vector<Document>& documents, int num_threads) const {
    const int64_t n = static_cast<int64_t>(documents.size());
    std::vector<uint8_t> results(documents.size(), 0);

#ifdef _OPENMP
    const int threads = num_threads > 0 ? num_threads : omp_get_max_threads();
    #pragma omp parallel for num_threads(threads) schedule(dynamic, 64)
#else
    (void)num_threads;
#endif
    for (int64_t i = 0; i < n; ++i) {
        results[i] = classify_text(documents[i].text) ? 1 : 0;
    }

    LabelSet labels;
    for (size_t i = 0; i < documents.size(); ++i) {
        if (!labels.add(documents[i].id, results[i] != 0)) {
            throw std::runtime_error("duplicate document id '" + documents[i].id + "'");
        }
    }
    return labels;
}

}  // namespace declist
