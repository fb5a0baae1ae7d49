#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <unordered_set>

namespace declist {

/**
 * Tokenization settings shared by training and inference.
 *
 * Both paths must use the same stop set, otherwise features learned at
 * training time never line up with the rendered test documents.
 */
struct TokenizerConfig {
    std::unordered_set<std::string> stop_tokens;
    std::string negation_word = "not";
    std::string negation_suffix = "n't";
    std::string negation_prefix = "NOT_";

    // Articles, common prepositions/conjunctions and stray punctuation
    static const TokenizerConfig& defaults() {
        static const TokenizerConfig cfg{
            {"a", "an", "the", "to", "of", "and",
             ".", ",", "'", "\"", ";", ":", "-", "(", ")", "&"},
            "not", "n't", "NOT_"};
        return cfg;
    }
};

// N-gram orders extracted for every sentence
inline constexpr std::array<size_t, 2> kNgramOrders = {1, 2};

// How n-gram occurrences inside one document fold into class counts
enum class CountingMode {
    FREQUENCY,  // every occurrence
    PRESENCE,   // once per document
    HYBRID      // up to hybrid_cap per document
};

enum class Smoothing {
    LAPLACE,    // add one to the zero side only
    QUADRATIC   // zero side -> 1, other side -> (c-1)^2 + 1
};

struct TrainConfig {
    CountingMode mode = CountingMode::PRESENCE;
    int hybrid_cap = 2;
    Smoothing smoothing = Smoothing::LAPLACE;
    // Decisions below this log-likelihood are not written; inference never
    // reaches that far down the list in practice.
    double threshold = 2.5;
    TokenizerConfig tokenizer = TokenizerConfig::defaults();
};

struct ClassifierConfig {
    bool default_class = false;  // returned when no feature matches
    TokenizerConfig tokenizer = TokenizerConfig::defaults();
};

inline const char* counting_mode_name(CountingMode mode) {
    switch (mode) {
        case CountingMode::FREQUENCY: return "frequency";
        case CountingMode::PRESENCE: return "presence";
        case CountingMode::HYBRID: return "hybrid";
    }
    return "unknown";
}

inline const char* smoothing_name(Smoothing s) {
    switch (s) {
        case Smoothing::LAPLACE: return "laplace";
        case Smoothing::QUADRATIC: return "quadratic";
    }
    return "unknown";
}

}  // namespace declist
