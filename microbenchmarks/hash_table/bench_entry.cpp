#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <vector>

#include "chain/builder.hpp"
#include "tokenizer.hpp"

namespace {

using clock = std::chrono::steady_clock;

struct Config {
  std::string file;
  int words = 1'000'000;
  int vocab = 20'000;
  int iterations = 5;
};

Config parse_flags(int argc, char** argv) {
  Config cfg;
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg.rfind("FILE=", 0) == 0) {
      cfg.file = arg.substr(5);
    } else if (arg.rfind("WORDS=", 0) == 0) {
      cfg.words = std::stoi(arg.substr(6));
    } else if (arg.rfind("VOCAB=", 0) == 0) {
      cfg.vocab = std::stoi(arg.substr(6));
    } else if (arg.rfind("ITER=", 0) == 0) {
      cfg.iterations = std::stoi(arg.substr(5));
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      std::exit(1);
    }
  }
  if (cfg.iterations < 1) cfg.iterations = 1;
  if (cfg.vocab < 1) cfg.vocab = 1;
  return cfg;
}

// Zipf-like token stream so a few words dominate, as in natural text.
std::vector<std::string> synthetic_tokens(int words, int vocab) {
  std::vector<double> weights(static_cast<size_t>(vocab));
  for (int r = 0; r < vocab; ++r) weights[r] = 1.0 / (r + 1);
  std::discrete_distribution<int> dist(weights.begin(), weights.end());
  std::mt19937 gen(1234);

  std::vector<std::string> tokens;
  tokens.reserve(static_cast<size_t>(words));
  for (int i = 0; i < words; ++i) {
    tokens.push_back("w" + std::to_string(dist(gen)));
  }
  return tokens;
}

struct IterationResult {
  double build_ms = 0.0;
  double find_ms = 0.0;
  size_t unique = 0;
  size_t capacity = 0;
};

IterationResult run_once(const std::vector<std::string>& tokens) {
  IterationResult result;
  auto start = clock::now();
  auto table = chain::build_transition_table(tokens);
  auto mid = clock::now();

  size_t checksum = 0;
  for (const auto& token : tokens) {
    const auto* info = table.find(token);
    if (info) checksum += info->occur_count();
  }
  auto end = clock::now();

  result.build_ms =
      std::chrono::duration<double, std::milli>(mid - start).count();
  result.find_ms =
      std::chrono::duration<double, std::milli>(end - mid).count();
  result.unique = table.size();
  result.capacity = table.capacity();
  static volatile size_t sink = 0;
  sink += checksum;
  return result;
}

}  // namespace

int main(int argc, char** argv) try {
  auto cfg = parse_flags(argc, argv);
  auto tokens = cfg.file.empty() ? synthetic_tokens(cfg.words, cfg.vocab)
                                 : load_corpus_tokens(cfg.file);

  std::cout << "hash_table benchmark" << std::endl;
  std::cout << "  source     : " << (cfg.file.empty() ? "synthetic" : cfg.file)
            << std::endl;
  std::cout << "  tokens     : " << tokens.size() << std::endl;
  std::cout << "  iterations : " << cfg.iterations << std::endl;

  auto warm_up = run_once(tokens);

  std::vector<double> build_ms;
  std::vector<double> find_ms;
  for (int i = 0; i < cfg.iterations; ++i) {
    auto iter = run_once(tokens);
    build_ms.push_back(iter.build_ms);
    find_ms.push_back(iter.find_ms);
  }

  auto [bmin, bmax] = std::minmax_element(build_ms.begin(), build_ms.end());
  auto [fmin, fmax] = std::minmax_element(find_ms.begin(), find_ms.end());
  double bavg = std::accumulate(build_ms.begin(), build_ms.end(), 0.0) /
                static_cast<double>(build_ms.size());
  double favg = std::accumulate(find_ms.begin(), find_ms.end(), 0.0) /
                static_cast<double>(find_ms.size());

  std::cout << std::fixed << std::setprecision(4);
  std::cout << "Unique words : " << warm_up.unique << " (capacity "
            << warm_up.capacity << ")" << std::endl;
  std::cout << "Build ms     : min=" << *bmin << " avg=" << bavg
            << " max=" << *bmax << std::endl;
  std::cout << "Find ms      : min=" << *fmin << " avg=" << favg
            << " max=" << *fmax << std::endl;
  if (favg > 0.0) {
    std::cout << "Lookups/s    : " << (tokens.size() * 1000.0) / favg
              << std::endl;
  }
  std::cout.unsetf(std::ios::floatfield);

  return 0;
} catch (const std::exception& ex) {
  std::cerr << "hash_table benchmark failed: " << ex.what() << std::endl;
  return 1;
}
