#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "chain/cache.hpp"
#include "chain/transition_table.hpp"
#include "poem/generator.hpp"

namespace poem {

struct PoemConfig {
  std::string corpus_path = "data/combined_cleaned.txt";
  std::string cache_path = chain::kDefaultCachePath;
  uint32_t seed = 0;  // 0 draws a random seed
  bool use_cache = true;
  bool show_progress = true;

  // POEM_CORPUS, POEM_CACHE, POEM_SEED, POEM_USE_CACHE, POEM_PROGRESS
  static PoemConfig from_env();
};

// Loads the cached table when present and valid, otherwise builds it from
// the corpus and refreshes the cache. Throws std::runtime_error when the
// corpus cannot be read or holds no tokens.
chain::TransitionTable obtain_table(const PoemConfig &config);

// Always builds from the corpus; saves the cache when caching is enabled.
chain::TransitionTable rebuild_table(const PoemConfig &config);

PoemResult write_poem(const chain::TransitionTable &table,
                      const std::string &start_word, int length,
                      const PoemConfig &config);

// Writes unique word count, capacity, load factor and the top_n most
// frequent words as pretty-printed JSON.
void dump_table_summary(const chain::TransitionTable &table,
                        const std::string &filename, size_t top_n = 25);

}  // namespace poem
