#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace chain {

// Occurrence count of a word plus every token seen right after it, in corpus
// order. Duplicates are kept: a follower seen k times is sampled k times as
// often. occur_count() always equals follow_words().size().
struct WordFreqInfo {
  WordFreqInfo() = default;
  explicit WordFreqInfo(std::string word);
  WordFreqInfo(std::string word, std::vector<std::string> follows);

  void update_follows(const std::string &next);

  const std::string &word() const { return word_; }
  size_t occur_count() const { return follows_.size(); }
  const std::vector<std::string> &follow_words() const { return follows_; }

  // throws std::out_of_range unless index < occur_count()
  const std::string &follow_word_at(size_t index) const;

 private:
  std::string word_;
  std::vector<std::string> follows_;
};

}  // namespace chain
