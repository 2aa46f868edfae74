#ifndef __CORPUS_RANK_DISTRIBUTION_HH__
#define __CORPUS_RANK_DISTRIBUTION_HH__

#include "graph.hh"
#include <cstddef>
#include <vector>

namespace corpus_rank {

// Probability value per page of a Graph, indexed by NodeId.
class Distribution {
public:
  Distribution() = default;
  explicit Distribution(size_t num_pages, double value = 0.0)
      : values_(num_pages, value) {}

  double &operator[](NodeId id) { return values_[id]; }
  double operator[](NodeId id) const { return values_[id]; }

  size_t size() const { return values_.size(); }
  const std::vector<double> &Values() const { return values_; }

  double Sum() const;

  // Largest |this[p] - other[p]| over all pages. Sizes must match.
  double MaxAbsDelta(const Distribution &other) const;

  // Sum of |this[p] - other[p]|. Sizes must match.
  double L1Distance(const Distribution &other) const;

  void swap(Distribution &other) noexcept { values_.swap(other.values_); }

private:
  std::vector<double> values_;
};

} // namespace corpus_rank

#endif
