#include "poem/writer.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "chain/builder.hpp"
#include "chain/cache.hpp"
#include "nlohmann/json.hpp"
#include "probs.hpp"
#include "tokenizer.hpp"
#include "utils.hpp"

namespace poem {

PoemConfig PoemConfig::from_env() {
  PoemConfig cfg;
  cfg.corpus_path = getenv_str("POEM_CORPUS", cfg.corpus_path);
  cfg.cache_path = getenv_str("POEM_CACHE", cfg.cache_path);
  cfg.seed = static_cast<uint32_t>(getenv_int("POEM_SEED", 0));
  cfg.use_cache = getenv_int("POEM_USE_CACHE", 1) != 0;
  cfg.show_progress = getenv_int("POEM_PROGRESS", 1) != 0;
  return cfg;
}

chain::TransitionTable rebuild_table(const PoemConfig &config) {
  auto tokens = load_corpus_tokens(config.corpus_path, config.show_progress);
  std::cout << "Parsed " << tokens.size() << " words from file." << std::endl;
  if (tokens.empty()) {
    throw std::runtime_error("Corpus has no tokens: " + config.corpus_path);
  }

  std::cout << "Building hash table from " << tokens.size() << " words..."
            << std::endl;
  auto start = std::chrono::steady_clock::now();
  auto table = chain::build_transition_table(tokens, config.show_progress);
  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::steady_clock::now() - start);
  std::cout << "Hash table built with " << table.size() << " unique words in "
            << elapsed.count() << "s" << std::endl;

  if (config.use_cache) {
    std::cout << "Saving hash table to cache..." << std::endl;
    if (chain::save_table(table, config.cache_path)) {
      std::cout << "Hash table saved successfully!" << std::endl;
    } else {
      std::cout << "Failed to save hash table." << std::endl;
    }
  }
  return table;
}

chain::TransitionTable obtain_table(const PoemConfig &config) {
  if (config.use_cache && chain::cache_exists(config.cache_path)) {
    std::cout << "Found cached hash table ("
              << chain::cache_file_size(config.cache_path) / 1024 / 1024
              << " MB). Loading..." << std::endl;
    auto loaded = chain::load_table(config.cache_path);
    if (loaded) {
      std::cout << "Successfully loaded hash table with " << loaded->size()
                << " unique words!" << std::endl;
      return std::move(*loaded);
    }
    std::cout << "Failed to load cache. Building new hash table..."
              << std::endl;
  } else {
    std::cout << "No cached hash table found. Building from scratch..."
              << std::endl;
  }
  return rebuild_table(config);
}

PoemResult write_poem(const chain::TransitionTable &table,
                      const std::string &start_word, int length,
                      const PoemConfig &config) {
  if (config.seed != 0) {
    UniformIndexSampler sampler(config.seed);
    return generate_poem(table, start_word, length, sampler,
                         config.show_progress);
  }
  UniformIndexSampler sampler;
  return generate_poem(table, start_word, length, sampler,
                       config.show_progress);
}

void dump_table_summary(const chain::TransitionTable &table,
                        const std::string &filename, size_t top_n) {
  std::vector<const chain::WordFreqInfo *> records;
  records.reserve(table.size());
  table.for_each([&](const std::string &, const chain::WordFreqInfo &info) {
    records.push_back(&info);
  });
  std::sort(records.begin(), records.end(),
            [](const chain::WordFreqInfo *a, const chain::WordFreqInfo *b) {
              if (a->occur_count() != b->occur_count()) {
                return a->occur_count() > b->occur_count();
              }
              return a->word() < b->word();
            });
  if (records.size() > top_n) records.resize(top_n);

  json top = json::array();
  for (const auto *info : records) {
    std::set<std::string> distinct(info->follow_words().begin(),
                                   info->follow_words().end());
    top.push_back(json{{"word", info->word()},
                       {"count", info->occur_count()},
                       {"distinct_follows", distinct.size()}});
  }
  json j = json{{"unique_words", table.size()},
                {"capacity", table.capacity()},
                {"load_factor", table.load_factor()},
                {"top", top}};
  dumpJson(j, filename);
}

}  // namespace poem
