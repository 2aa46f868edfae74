#include "iterative_estimator.hh"
#include "errors.hh"
#include "thread_group.hh"
#include "transition_model.hh"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace corpus_rank {

namespace {

const Graph &ValidateGraph(const Graph &graph) {
  if (graph.Empty()) {
    throw EmptyGraph("Cannot rank a graph without pages");
  }
  return graph;
}

double ValidateThreshold(double threshold) {
  if (!(threshold > 0.0) || !std::isfinite(threshold)) {
    throw InvalidThreshold("Convergence threshold must be positive, got " +
                           std::to_string(threshold));
  }
  return threshold;
}

double ValidateDamping(double damping_factor) {
  ValidateDampingFactor(damping_factor);
  return damping_factor;
}

Distribution UniformRanks(const Graph &graph) {
  ValidateGraph(graph);
  return Distribution(graph.NumPages(),
                      1.0 / static_cast<double>(graph.NumPages()));
}

} // namespace

IterativeEstimator::IterativeEstimator(const Graph &graph,
                                       double damping_factor, double threshold,
                                       size_t num_threads)
    : IterativeEstimator(graph, damping_factor, threshold, UniformRanks(graph),
                         num_threads) {}

IterativeEstimator::IterativeEstimator(const Graph &graph,
                                       double damping_factor, double threshold,
                                       Distribution initial_ranks,
                                       size_t num_threads)
    : graph_(ValidateGraph(graph)), threshold_(ValidateThreshold(threshold)),
      damping_factor_(ValidateDamping(damping_factor)),
      num_threads_(std::clamp<size_t>(num_threads, 1, graph.NumPages())),
      incoming_(graph.NumPages()), ranks_(std::move(initial_ranks)),
      next_ranks_(graph.NumPages()) {
  if (ranks_.size() != graph_.NumPages()) {
    throw std::invalid_argument(
        "Initial ranks cover " + std::to_string(ranks_.size()) +
        " pages, graph has " + std::to_string(graph_.NumPages()));
  }

  for (NodeId page = 0; page < graph_.NumPages(); ++page) {
    const auto &links = graph_.Links(page);
    if (links.empty()) {
      dangling_.push_back(page);
    }
    for (NodeId target : links) {
      incoming_[target].push_back(page);
    }
  }
}

double IterativeEstimator::UpdateRange(NodeId begin, NodeId end,
                                       double dangling_mass) {
  const auto num_pages = static_cast<double>(graph_.NumPages());
  const double base = (1.0 - damping_factor_) / num_pages;

  double max_diff = 0.0;
  for (NodeId page = begin; page < end; ++page) {
    // Dangling pages spread their rank evenly over every page
    double rank_sum = dangling_mass / num_pages;
    for (NodeId source : incoming_[page]) {
      rank_sum += ranks_[source] /
                  static_cast<double>(graph_.Links(source).size());
    }
    next_ranks_[page] = base + damping_factor_ * rank_sum;
    max_diff = std::max(max_diff, std::abs(next_ranks_[page] - ranks_[page]));
  }
  return max_diff;
}

double IterativeEstimator::Step() {
  double dangling_mass = 0.0;
  for (NodeId page : dangling_) {
    dangling_mass += ranks_[page];
  }

  const size_t num_pages = graph_.NumPages();
  double max_diff = 0.0;

  if (num_threads_ == 1) {
    max_diff = UpdateRange(0, num_pages, dangling_mass);
  } else {
    // Contiguous page ranges, one per thread. Threads only read ranks_ and
    // only write their own slice of next_ranks_ and their own delta.
    std::vector<double> thread_diffs(num_threads_, 0.0);
    const size_t chunk = (num_pages + num_threads_ - 1) / num_threads_;
    ThreadGroup threads;
    for (size_t thread_id = 0; thread_id < num_threads_; ++thread_id) {
      NodeId begin = std::min(num_pages, thread_id * chunk);
      NodeId end = std::min(num_pages, begin + chunk);
      threads.Spawn([this, thread_id, begin, end, dangling_mass,
                     &thread_diffs]() {
        thread_diffs[thread_id] = UpdateRange(begin, end, dangling_mass);
      });
    }
    threads.JoinAll();
    max_diff = *std::max_element(thread_diffs.begin(), thread_diffs.end());
  }

  ranks_.swap(next_ranks_);
  ++iterations_;
  last_delta_ = max_diff;
  state_ = max_diff < threshold_ ? State::Converged : State::Iterating;

  spdlog::debug("Iteration {}: max rank change {:.3e}", iterations_,
                max_diff);
  return max_diff;
}

const Distribution &IterativeEstimator::Run(size_t max_iterations) {
  size_t iterations = 0;
  while (!Converged() && iterations < max_iterations) {
    Step();
    ++iterations;
  }

  if (Converged()) {
    spdlog::info("Iteration converged after {} passes (max change {:.3e})",
                 iterations_, last_delta_);
  } else {
    spdlog::warn("Iteration stopped at the limit of {} passes without "
                 "converging (max change {:.3e}, threshold {:.3e})",
                 max_iterations, last_delta_, threshold_);
  }
  return ranks_;
}

Distribution IteratePageRank(const Graph &graph, double damping_factor,
                             double threshold, size_t num_threads) {
  IterativeEstimator estimator(graph, damping_factor, threshold, num_threads);
  return estimator.Run();
}

} // namespace corpus_rank
