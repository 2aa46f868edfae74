#ifndef __CORPUS_RANK_ITERATIVE_ESTIMATOR_HH__
#define __CORPUS_RANK_ITERATIVE_ESTIMATOR_HH__

#include "distribution.hh"
#include "graph.hh"
#include <cstddef>
#include <limits>
#include <vector>

namespace corpus_rank {

constexpr double kDefaultConvergenceThreshold = 0.001;

// Fixed-point iteration of the PageRank recurrence
//
//   PR(p) = (1 - d) / N + d * sum_{i -> p} PR(i) / L(i)
//
// where a page without links counts as linking to all N pages. Every pass
// reads only the previous pass's ranks and writes a separate table, so the
// per-page updates can be split across threads.
class IterativeEstimator {
public:
  enum class State {
    Initialized, // Ranks hold the starting distribution
    Iterating,   // At least one pass done, last delta >= threshold
    Converged,   // Last pass moved every page by less than threshold
  };

  // Starts from the uniform distribution 1/N.
  // Throws EmptyGraph, InvalidThreshold or InvalidDampingFactor.
  IterativeEstimator(const Graph &graph, double damping_factor,
                     double threshold, size_t num_threads = 1);

  // Starts from initial_ranks, which must have one entry per page.
  IterativeEstimator(const Graph &graph, double damping_factor,
                     double threshold, Distribution initial_ranks,
                     size_t num_threads = 1);

  // Prevent copying and assignment
  IterativeEstimator(const IterativeEstimator &) = delete;
  IterativeEstimator &operator=(const IterativeEstimator &) = delete;

  // Apply one synchronous update pass.
  // Returns: the largest per-page rank change of the pass.
  double Step();

  // Step until converged or max_iterations passes have been run.
  const Distribution &Run(
      size_t max_iterations = std::numeric_limits<size_t>::max());

  State GetState() const { return state_; }
  bool Converged() const { return state_ == State::Converged; }
  size_t Iterations() const { return iterations_; }
  double LastDelta() const { return last_delta_; }
  const Distribution &Ranks() const { return ranks_; }

private:
  // Computes next_ranks_ for pages [begin, end) and returns their max delta.
  double UpdateRange(NodeId begin, NodeId end, double dangling_mass);

  const Graph &graph_;
  const double threshold_;
  const double damping_factor_;
  const size_t num_threads_;

  // Reverse adjacency: pages linking to p, for every p.
  std::vector<std::vector<NodeId>> incoming_;
  std::vector<NodeId> dangling_;

  Distribution ranks_;
  Distribution next_ranks_;
  State state_{State::Initialized};
  size_t iterations_{0};
  double last_delta_{std::numeric_limits<double>::infinity()};
};

// Runs an IterativeEstimator to convergence and returns its ranks.
Distribution IteratePageRank(const Graph &graph, double damping_factor,
                             double threshold = kDefaultConvergenceThreshold,
                             size_t num_threads = 1);

} // namespace corpus_rank

#endif
