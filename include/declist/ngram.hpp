#pragma once

#include "declist/types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace declist {

// Join tokens[begin, begin + n) with single spaces
std::string join_window(const Tokens& tokens, size_t begin, size_t n);

/**
 * Visit every contiguous n-token window of `tokens`, left to right.
 * Repeated windows are visited once per occurrence.
 * Throws std::invalid_argument for n == 0.
 */
void for_each_ngram(const Tokens& tokens, size_t n,
                    const std::function<void(const std::string&)>& fn);

// Collect the windows visited by for_each_ngram
std::vector<std::string> build_ngrams(const Tokens& tokens, size_t n);

}  // namespace declist
