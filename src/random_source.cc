#include "random_source.hh"
#include <stdexcept>

namespace corpus_rank {

namespace {
uint64_t ResolveSeed(uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | rd();
}
} // namespace

Mt19937RandomSource::Mt19937RandomSource(uint64_t seed)
    : seed_(ResolveSeed(seed)), rng_(seed_) {}

size_t Mt19937RandomSource::UniformIndex(size_t n) {
  if (n == 0) {
    throw std::invalid_argument("Cannot choose from an empty range");
  }
  std::uniform_int_distribution<size_t> dist(0, n - 1);
  return dist(rng_);
}

size_t Mt19937RandomSource::WeightedChoice(const std::vector<double> &weights) {
  if (weights.empty()) {
    throw std::invalid_argument("Cannot choose from an empty weight list");
  }
  std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
  return dist(rng_);
}

} // namespace corpus_rank
