#include "declist/ngram.hpp"

#include <stdexcept>

namespace declist {

std::string join_window(const Tokens& tokens, size_t begin, size_t n) {
    std::string out = tokens[begin];
    for (size_t j = 1; j < n; ++j) {
        out += ' ';
        out += tokens[begin + j];
    }
    return out;
}

void for_each_ngram(const Tokens& tokens, size_t n,
                    const std::function<void(const std::string&)>& fn) {
    if (n == 0) {
        throw std::invalid_argument("n-gram order must be >= 1");
    }
    if (tokens.size() < n) return;
    for (size_t i = 0; i + n <= tokens.size(); ++i) {
        fn(join_window(tokens, i, n));
    }
}

std::vector<std::string> build_ngrams(const Tokens& tokens, size_t n) {
    std::vector<std::string> out;
    if (tokens.size() >= n && n > 0) out.reserve(tokens.size() - n + 1);
    for_each_ngram(tokens, n, [&](const std::string& g) { out.push_back(g); });
    return out;
}

}  // namespace declist
