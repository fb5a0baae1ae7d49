#pragma once

#include "declist/config.hpp"
#include "declist/feature_table.hpp"
#include "declist/types.hpp"

#include <memory>

namespace declist {

/**
 * Strategy for folding one document's n-grams into the global table.
 *
 * Every variant sees the same preprocessed sentences (filtered and
 * negation-scoped) and extracts all orders in kNgramOrders per sentence;
 * they differ only in how repeated features within the document count.
 */
class CountingPolicy {
public:
    virtual ~CountingPolicy() = default;

    virtual void count_document(const Sentences& sentences, bool positive,
                                FeatureTable& table) const = 0;

    virtual CountingMode mode() const = 0;
};

// Every occurrence adds one
class FrequencyCounting : public CountingPolicy {
public:
    void count_document(const Sentences& sentences, bool positive,
                        FeatureTable& table) const override;
    CountingMode mode() const override { return CountingMode::FREQUENCY; }
};

// Each distinct feature adds one per document
class PresenceCounting : public CountingPolicy {
public:
    void count_document(const Sentences& sentences, bool positive,
                        FeatureTable& table) const override;
    CountingMode mode() const override { return CountingMode::PRESENCE; }
};

// Occurrences add one each up to `cap` per document.
// Presence counting is the cap == 1 case.
class HybridCounting : public CountingPolicy {
public:
    explicit HybridCounting(int cap);

    void count_document(const Sentences& sentences, bool positive,
                        FeatureTable& table) const override;
    CountingMode mode() const override { return CountingMode::HYBRID; }

    int cap() const { return cap_; }

private:
    int cap_;
};

std::unique_ptr<CountingPolicy> make_counting_policy(const TrainConfig& config);

}  // namespace declist
