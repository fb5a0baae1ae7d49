#include "declist/counting.hpp"
#include "declist/ngram.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace declist {

namespace {

template <typename Fn>
void for_each_feature(const Sentences& sentences, Fn&& fn) {
    for (const Tokens& tokens : sentences) {
        for (size_t n : kNgramOrders) {
            for_each_ngram(tokens, n, fn);
        }
    }
}

}  // namespace

void FrequencyCounting::count_document(const Sentences& sentences, bool positive,
                                       FeatureTable& table) const {
    for_each_feature(sentences, [&](const std::string& feature) {
        table.get_or_add(feature).increment(positive);
    });
}

void PresenceCounting::count_document(const Sentences& sentences, bool positive,
                                      FeatureTable& table) const {
    std::unordered_set<std::string> seen;
    std::vector<std::string> distinct;  // arrival order
    for_each_feature(sentences, [&](const std::string& feature) {
        if (seen.insert(feature).second) {
            distinct.push_back(feature);
        }
    });

    for (const std::string& feature : distinct) {
        table.get_or_add(feature).increment(positive);
    }
}

HybridCounting::HybridCounting(int cap) : cap_(cap) {
    if (cap < 1) {
        throw std::invalid_argument("hybrid cap must be >= 1, got " + std::to_string(cap));
    }
}

void HybridCounting::count_document(const Sentences& sentences, bool positive,
                                    FeatureTable& table) const {
    FeatureTable local;
    for_each_feature(sentences, [&](const std::string& feature) {
        Decision& d = local.get_or_add(feature);
        if (d.count(positive) < cap_) {
            d.increment(positive);
        }
    });
    table.merge(local);
}

std::unique_ptr<CountingPolicy> make_counting_policy(const TrainConfig& config) {
    switch (config.mode) {
        case CountingMode::FREQUENCY:
            return std::make_unique<FrequencyCounting>();
        case CountingMode::PRESENCE:
            return std::make_unique<PresenceCounting>();
        case CountingMode::HYBRID:
            return std::make_unique<HybridCounting>(config.hybrid_cap);
    }
    throw std::invalid_argument("unknown counting mode");
}

}  // namespace declist
