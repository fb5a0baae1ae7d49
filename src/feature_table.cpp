#include "declist/feature_table.hpp"

#include <utility>

namespace declist {

Decision& FeatureTable::get_or_add(const std::string& feature) {
    auto it = index_.find(feature);
    if (it != index_.end()) {
        return decisions_[it->second];
    }
    index_.emplace(feature, decisions_.size());
    decisions_.emplace_back(feature);
    return decisions_.back();
}

const Decision* FeatureTable::find(const std::string& feature) const {
    auto it = index_.find(feature);
    return it == index_.end() ? nullptr : &decisions_[it->second];
}

void FeatureTable::merge(const FeatureTable& other) {
    for (const Decision& d : other.decisions_) {
        get_or_add(d.feature).merge_counts(d);
    }
}

void FeatureTable::clear() {
    decisions_.clear();
    index_.clear();
}

std::vector<Decision> FeatureTable::release() {
    std::vector<Decision> out = std::move(decisions_);
    clear();
    return out;
}

}  // namespace declist
