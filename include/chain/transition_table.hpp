#pragma once

#include <string>

#include "chain/word_freq_info.hpp"
#include "hash_table.hpp"

namespace chain {

// word -> record of the words observed right after it
using TransitionTable = HashTable<std::string, WordFreqInfo>;

}  // namespace chain
