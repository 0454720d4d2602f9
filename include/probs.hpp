#ifndef PROBS_HPP
#define PROBS_HPP

#include <cstddef>
#include <cstdint>
#include <random>

// Source of uniform indices for the random walk. Kept abstract so generation
// can be driven by a fixed sequence in tests.
struct IndexSampler {
  virtual ~IndexSampler() = default;
  // uniform in [0, bound); throws std::invalid_argument when bound == 0
  virtual size_t next(size_t bound) = 0;
};

struct UniformIndexSampler : public IndexSampler {
  std::mt19937 gen;
  UniformIndexSampler();
  explicit UniformIndexSampler(uint32_t seed);
  size_t next(size_t bound) override;
};
#endif  // PROBS_HPP
