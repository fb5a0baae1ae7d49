#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace declist {

/**
 * Document id -> class label, kept in insertion (file) order.
 */
class LabelSet {
public:
    using Entry = std::pair<std::string, bool>;

    // Returns false if `id` is already present; the set is left unchanged
    bool add(const std::string& id, bool positive) {
        if (!index_.emplace(id, entries_.size()).second) {
            return false;
        }
        entries_.emplace_back(id, positive);
        return true;
    }

    std::optional<bool> get(const std::string& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) return std::nullopt;
        return entries_[it->second].second;
    }

    bool contains(const std::string& id) const {
        return index_.find(id) != index_.end();
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    size_t count_positive() const {
        size_t n = 0;
        for (const auto& e : entries_) n += e.second ? 1 : 0;
        return n;
    }

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace declist
