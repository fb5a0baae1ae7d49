#include "declist/trainer.hpp"
#include "declist/corpus_io.hpp"
#include "declist/decision_list.hpp"
#include "declist/scorer.hpp"
#include "declist/tokenizer.hpp"

#include <stdexcept>
#include <utility>

namespace declist {

Trainer::Trainer(TrainConfig config)
    : config_(std::move(config)),
      policy_(make_counting_policy(config_)) {}

void Trainer::add_document(std::string_view text, bool positive) {
    if (finished_) {
        throw std::logic_error("Trainer: add_document() after finish()");
    }
    const Sentences sentences = preprocess_sentences(text, config_.tokenizer);
    policy_->count_document(sentences, positive, table_);

    ++stats_.documents;
    if (positive) {
        ++stats_.positive_documents;
    } else {
        ++stats_.negative_documents;
    }
    stats_.sentences += sentences.size();
}

DecisionList Trainer::finish() {
    if (finished_) {
        throw std::logic_error("Trainer: finish() called twice");
    }
    finished_ = true;
    stats_.features = table_.size();

    score_all(table_, config_.smoothing);
    DecisionList decisions = table_.release();
    sort_decisions(decisions);
    return decisions;
}

DecisionList train_file(const std::string& filename, const TrainConfig& config,
                        TrainStats* stats) {
    Trainer trainer(config);
    for_each_training_document(filename, [&](const LabeledDocument& doc) {
        trainer.add_document(doc);
    });
    DecisionList decisions = trainer.finish();
    if (stats) *stats = trainer.stats();
    return decisions;
}

}  // namespace declist
