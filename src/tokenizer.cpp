#include "declist/tokenizer.hpp"

#include <cctype>

namespace declist {

namespace {

inline bool is_sentence_end(char c) {
    return c == '.' || c == '?' || c == '!';
}

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return !suffix.empty() && s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::vector<std::string_view> split_sentences(std::string_view text) {
    std::vector<std::string_view> sentences;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (is_sentence_end(text[i])) {
            sentences.push_back(text.substr(start, i + 1 - start));
            start = i + 1;
        }
    }
    if (start < text.size()) {
        sentences.push_back(text.substr(start));
    }
    return sentences;
}

Tokens tokenize_sentence(std::string_view sentence, const TokenizerConfig& config) {
    Tokens tokens;
    size_t i = 0;
    const size_t n = sentence.size();
    while (i < n) {
        while (i < n && is_space(sentence[i])) ++i;
        const size_t begin = i;
        while (i < n && !is_space(sentence[i])) ++i;
        if (i > begin) {
            std::string token(sentence.substr(begin, i - begin));
            if (config.stop_tokens.find(token) == config.stop_tokens.end()) {
                tokens.push_back(std::move(token));
            }
        }
    }
    return tokens;
}

bool apply_negation_scope(Tokens& tokens, const TokenizerConfig& config) {
    // The last token has nothing after it to scope, so it is never a cue.
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i] == config.negation_word || ends_with(tokens[i], config.negation_suffix)) {
            for (size_t j = i + 1; j < tokens.size(); ++j) {
                tokens[j].insert(0, config.negation_prefix);
            }
            return true;
        }
    }
    return false;
}

Sentences preprocess_sentences(std::string_view text, const TokenizerConfig& config) {
    Sentences out;
    for (std::string_view sentence : split_sentences(text)) {
        Tokens tokens = tokenize_sentence(sentence, config);
        if (tokens.empty()) continue;
        apply_negation_scope(tokens, config);
        out.push_back(std::move(tokens));
    }
    return out;
}

std::string render_for_matching(const Sentences& sentences) {
    std::string out = " ";
    for (size_t s = 0; s < sentences.size(); ++s) {
        if (s > 0) out += "  ";
        const Tokens& tokens = sentences[s];
        for (size_t t = 0; t < tokens.size(); ++t) {
            if (t > 0) out += ' ';
            out += tokens[t];
        }
    }
    out += ' ';
    return out;
}

}  // namespace declist
