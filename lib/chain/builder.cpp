#include "chain/builder.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "progress.hpp"

namespace chain {

TransitionTable build_transition_table(const std::vector<std::string> &tokens,
                                       bool show_progress) {
  TransitionTable table;
  if (tokens.size() < 2) return table;
  table.reserve(std::max<size_t>(1, tokens.size() / 10));

  ProgressBar progress("Hashing", tokens.size() - 1, std::cout,
                       show_progress);
  for (size_t i = 0; i + 1 < tokens.size(); ++i) {
    const std::string &word = tokens[i];
    WordFreqInfo *info = table.find(word);
    if (!info) {
      table.insert(word, WordFreqInfo(word));
      info = table.find(word);
    }
    info->update_follows(tokens[i + 1]);
    progress.increment();
  }
  progress.finish();
  return table;
}

}  // namespace chain
