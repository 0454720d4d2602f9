#include "poem/generator.hpp"

#include <iostream>
#include <string>
#include <unordered_set>

#include "probs.hpp"
#include "progress.hpp"
#include "tokenizer.hpp"

namespace poem {

namespace {

bool exempt_from_repeat_check(const std::string& token) {
  return WordTokenizer::is_punctuation(token) ||
         token == WordTokenizer::newline_token;
}

}  // namespace

PoemResult generate_poem(const chain::TransitionTable& table,
                         const std::string& start_word, int length,
                         IndexSampler& sampler, bool show_progress) {
  PoemResult result;
  if (length <= 0) return result;

  std::unordered_set<std::string> used_words;
  std::string current = start_word;
  ProgressBar progress("Writing", static_cast<size_t>(length), std::cout,
                       show_progress);

  for (int step = 0; step < length; ++step) {
    const chain::WordFreqInfo* info = table.find(current);
    if (!info || info->occur_count() == 0) {
      std::cerr << "Warning: Word '" << current
                << "' not found in hash table. Stopping generation."
                << std::endl;
      result.stopped_early = true;
      result.missing_word = current;
      break;
    }

    std::string next;
    for (int attempt = 0; attempt < kMaxRepeatAttempts; ++attempt) {
      next = info->follow_word_at(sampler.next(info->occur_count()));
      if (exempt_from_repeat_check(next) || used_words.count(next) == 0) {
        break;
      }
    }

    result.text += current;
    if (step < length - 1 && !WordTokenizer::is_punctuation(next)) {
      result.text += ' ';
    }
    ++result.words_emitted;

    if (!exempt_from_repeat_check(current)) used_words.insert(current);
    current = next;
    progress.increment();
  }
  progress.finish();
  return result;
}

}  // namespace poem
