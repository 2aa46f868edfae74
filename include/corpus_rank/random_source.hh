#ifndef __CORPUS_RANK_RANDOM_SOURCE_HH__
#define __CORPUS_RANK_RANDOM_SOURCE_HH__

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace corpus_rank {

// Source of the draws made by the sample estimator.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Uniform index in [0, n). n must be positive.
  virtual size_t UniformIndex(size_t n) = 0;

  // Index i with probability weights[i] / sum(weights).
  virtual size_t WeightedChoice(const std::vector<double> &weights) = 0;
};

class Mt19937RandomSource : public RandomSource {
public:
  // seed 0 draws a seed from std::random_device.
  explicit Mt19937RandomSource(uint64_t seed);

  size_t UniformIndex(size_t n) override;
  size_t WeightedChoice(const std::vector<double> &weights) override;

  uint64_t Seed() const { return seed_; }

private:
  uint64_t seed_;
  std::mt19937_64 rng_;
};

} // namespace corpus_rank

#endif
