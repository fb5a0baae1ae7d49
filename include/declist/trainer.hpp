#pragma once

#include "declist/config.hpp"
#include "declist/counting.hpp"
#include "declist/feature_table.hpp"
#include "declist/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace declist {

struct TrainStats {
    size_t documents = 0;
    size_t positive_documents = 0;
    size_t negative_documents = 0;
    size_t sentences = 0;
    size_t features = 0;  // distinct features, set by finish()
};

/**
 * One training run: documents are counted one at a time into a feature
 * table, then finish() scores every feature once and returns the sorted
 * decision list. No documents may be added after finish().
 */
class Trainer {
public:
    explicit Trainer(TrainConfig config = {});

    void add_document(std::string_view text, bool positive);
    void add_document(const LabeledDocument& doc) { add_document(doc.text, doc.positive); }

    DecisionList finish();

    const TrainStats& stats() const { return stats_; }
    bool finished() const { return finished_; }

private:
    TrainConfig config_;
    std::unique_ptr<CountingPolicy> policy_;
    FeatureTable table_;
    TrainStats stats_;
    bool finished_ = false;
};

// Train on every document of a corpus file
DecisionList train_file(const std::string& filename, const TrainConfig& config,
                        TrainStats* stats = nullptr);

}  // namespace declist
