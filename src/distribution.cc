#include "distribution.hh"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace corpus_rank {

namespace {
void CheckSameSize(const Distribution &a, const Distribution &b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument("Distributions cover " +
                                std::to_string(a.size()) + " and " +
                                std::to_string(b.size()) + " pages");
  }
}
} // namespace

double Distribution::Sum() const {
  return std::accumulate(values_.begin(), values_.end(), 0.0);
}

double Distribution::MaxAbsDelta(const Distribution &other) const {
  CheckSameSize(*this, other);
  double max_diff = 0.0;
  for (size_t i = 0; i < values_.size(); ++i) {
    max_diff = std::max(max_diff, std::abs(values_[i] - other.values_[i]));
  }
  return max_diff;
}

double Distribution::L1Distance(const Distribution &other) const {
  CheckSameSize(*this, other);
  double distance = 0.0;
  for (size_t i = 0; i < values_.size(); ++i) {
    distance += std::abs(values_[i] - other.values_[i]);
  }
  return distance;
}

} // namespace corpus_rank
