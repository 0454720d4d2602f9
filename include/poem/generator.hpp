/**
 * @file generator.hpp
 * @brief Random walk over the transition table that writes a poem.
 */

#pragma once

#include <cstddef>
#include <string>

#include "chain/transition_table.hpp"

struct IndexSampler;

namespace poem {

/// Sampling attempts spent looking for a word not used yet in the poem.
constexpr int kMaxRepeatAttempts = 50;

/**
 * @struct PoemResult
 * @brief Generated text plus how the walk ended.
 */
struct PoemResult {
  std::string text;           ///< Tokens joined with the spacing rules applied
  size_t words_emitted = 0;   ///< Tokens appended to text
  bool stopped_early = false; ///< Walk hit a word with no usable record
  std::string missing_word;   ///< That word, when stopped_early is set
};

/**
 * @brief Walk the chain from start_word for up to length steps.
 *
 * Each step samples a follower of the current word, retrying up to
 * kMaxRepeatAttempts times to avoid words already in the poem (punctuation
 * and the newline marker are always accepted). The current word is then
 * appended: punctuation attaches to the previous token, and a space follows
 * every token except the last one and one followed by punctuation.
 *
 * A word without a record ends the walk with a warning on stderr; the text
 * produced so far is still returned.
 *
 * @param table Built transition table (read only)
 * @param start_word First word of the poem
 * @param length Number of steps; values <= 0 produce an empty poem
 * @param sampler Uniform index source
 * @param show_progress Draw a "Writing" progress bar on stdout
 */
PoemResult generate_poem(const chain::TransitionTable& table,
                         const std::string& start_word, int length,
                         IndexSampler& sampler, bool show_progress = false);

}  // namespace poem
