#pragma once

#include "declist/config.hpp"
#include "declist/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace declist {

/**
 * Split text after every sentence-final mark ('.', '?', '!').
 * The mark stays at the end of the sentence it closes; empty pieces are
 * dropped.
 */
std::vector<std::string_view> split_sentences(std::string_view text);

/**
 * Split one sentence on whitespace runs and drop stop tokens.
 */
Tokens tokenize_sentence(std::string_view sentence, const TokenizerConfig& config);

/**
 * Prefix every token after the first negation cue of the sentence.
 *
 * A cue is the negation word or any token ending in the negation suffix.
 * Only the first cue opens a scope, which runs to the end of the sentence.
 * Rewrites `tokens` in place; returns true if a scope was opened.
 */
bool apply_negation_scope(Tokens& tokens, const TokenizerConfig& config);

/**
 * Full per-document pipeline: sentences -> filtered tokens -> negation scope.
 * Sentences left without tokens after filtering are omitted.
 */
Sentences preprocess_sentences(std::string_view text, const TokenizerConfig& config);

/**
 * Render preprocessed sentences for substring matching.
 *
 * Tokens are joined by one space, sentences by two, and the result is
 * padded with a space on each side so " feature " only matches whole
 * tokens inside one sentence.
 */
std::string render_for_matching(const Sentences& sentences);

}  // namespace declist
