#ifndef __CORPUS_RANK_SAMPLE_ESTIMATOR_HH__
#define __CORPUS_RANK_SAMPLE_ESTIMATOR_HH__

#include "distribution.hh"
#include "graph.hh"
#include "random_source.hh"
#include <cstddef>
#include <cstdint>

namespace corpus_rank {

constexpr size_t kDefaultSampleCount = 10000;

// Estimates PageRank by walking a single random-surfer chain of `samples`
// pages. The first page is chosen uniformly, each following page is drawn
// from the transition model of the previous one. The rank of a page is the
// fraction of samples that landed on it.
//
// Throws InvalidSampleCount if samples < 1, EmptyGraph for a graph without
// pages and InvalidDampingFactor for a damping factor outside (0, 1).
Distribution SamplePageRank(const Graph &graph, double damping_factor,
                            size_t samples, RandomSource &random);

// Splits `samples` over independent chains, each on its own thread and RNG
// seeded with seed + chain index (seed 0: random seeds), and merges the
// visit tallies.
Distribution SamplePageRankChains(const Graph &graph, double damping_factor,
                                  size_t samples, size_t num_chains,
                                  uint64_t seed);

} // namespace corpus_rank

#endif
