#pragma once

#include "declist/types.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace declist {

/**
 * Feature -> Decision map that remembers arrival order.
 *
 * Decisions live in a vector in first-encounter order; a hash index maps
 * each feature to its slot. Iteration and release() follow arrival order,
 * so hash layout never leaks into the sorted output.
 */
class FeatureTable {
public:
    // Return the decision for `feature`, creating it with zero counts if new
    Decision& get_or_add(const std::string& feature);

    // nullptr if absent
    const Decision* find(const std::string& feature) const;

    // Sum another table's counts into this one, in the other table's order
    void merge(const FeatureTable& other);

    size_t size() const { return decisions_.size(); }
    bool empty() const { return decisions_.empty(); }
    void clear();

    std::vector<Decision>::iterator begin() { return decisions_.begin(); }
    std::vector<Decision>::iterator end() { return decisions_.end(); }
    std::vector<Decision>::const_iterator begin() const { return decisions_.begin(); }
    std::vector<Decision>::const_iterator end() const { return decisions_.end(); }

    // Move the decisions out in arrival order; the table is left empty
    std::vector<Decision> release();

private:
    std::vector<Decision> decisions_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace declist
