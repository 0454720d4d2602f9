#include "probs.hpp"

#include <random>
#include <stdexcept>

UniformIndexSampler::UniformIndexSampler() : gen(std::random_device{}()) {}

UniformIndexSampler::UniformIndexSampler(uint32_t seed) : gen(seed) {}

size_t UniformIndexSampler::next(size_t bound) {
  if (bound == 0) {
    throw std::invalid_argument("Cannot sample an index from an empty range");
  }
  std::uniform_int_distribution<size_t> dist(0, bound - 1);
  return dist(gen);
}
