#include "chain/word_freq_info.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chain {

WordFreqInfo::WordFreqInfo(std::string word) : word_(std::move(word)) {}

WordFreqInfo::WordFreqInfo(std::string word, std::vector<std::string> follows)
    : word_(std::move(word)), follows_(std::move(follows)) {}

void WordFreqInfo::update_follows(const std::string &next) {
  follows_.push_back(next);
}

const std::string &WordFreqInfo::follow_word_at(size_t index) const {
  if (index >= follows_.size()) {
    throw std::out_of_range("Follow index " + std::to_string(index) +
                            " out of range for '" + word_ + "' with " +
                            std::to_string(follows_.size()) + " entries");
  }
  return follows_[index];
}

}  // namespace chain
