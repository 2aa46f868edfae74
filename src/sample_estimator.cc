#include "sample_estimator.hh"
#include "errors.hh"
#include "transition_model.hh"
#include "thread_group.hh"
#include "spdlog/spdlog.h"
#include <algorithm>

namespace corpus_rank {

namespace {

void ValidateSampling(const Graph &graph, double damping_factor,
                      size_t samples) {
  if (samples < 1) {
    throw InvalidSampleCount("Number of samples must be a positive integer");
  }
  if (graph.Empty()) {
    throw EmptyGraph("Cannot sample a graph without pages");
  }
  ValidateDampingFactor(damping_factor);
}

// Walks one chain of `samples` pages, adding each visit to tally.
void RunChain(const Graph &graph, double damping_factor, size_t samples,
              RandomSource &random, std::vector<size_t> &tally) {
  if (samples == 0) {
    return;
  }
  NodeId current = random.UniformIndex(graph.NumPages());
  ++tally[current];

  for (size_t i = 1; i < samples; ++i) {
    auto model = TransitionModel(graph, current, damping_factor);
    current = random.WeightedChoice(model.Values());
    ++tally[current];
  }
}

Distribution Normalize(const std::vector<size_t> &tally, size_t samples) {
  Distribution ranks(tally.size());
  for (NodeId page = 0; page < tally.size(); ++page) {
    ranks[page] =
        static_cast<double>(tally[page]) / static_cast<double>(samples);
  }
  return ranks;
}

} // namespace

Distribution SamplePageRank(const Graph &graph, double damping_factor,
                            size_t samples, RandomSource &random) {
  ValidateSampling(graph, damping_factor, samples);

  std::vector<size_t> tally(graph.NumPages(), 0);
  RunChain(graph, damping_factor, samples, random, tally);
  return Normalize(tally, samples);
}

Distribution SamplePageRankChains(const Graph &graph, double damping_factor,
                                  size_t samples, size_t num_chains,
                                  uint64_t seed) {
  ValidateSampling(graph, damping_factor, samples);
  num_chains = std::clamp<size_t>(num_chains, 1, samples);

  // Divide samples among chains, the first chains take the remainder
  std::vector<size_t> chain_samples(num_chains, samples / num_chains);
  for (size_t i = 0; i < samples % num_chains; ++i) {
    chain_samples[i]++;
  }

  // One RNG and tally per chain
  std::vector<Mt19937RandomSource> sources;
  sources.reserve(num_chains);
  for (size_t i = 0; i < num_chains; ++i) {
    sources.emplace_back(seed == 0 ? 0 : seed + i);
    spdlog::debug("Sampling chain {}: {} samples, seed {}", i,
                  chain_samples[i], sources.back().Seed());
  }
  std::vector<std::vector<size_t>> chain_tallies(
      num_chains, std::vector<size_t>(graph.NumPages(), 0));

  ThreadGroup threads;
  for (size_t chain = 0; chain < num_chains; ++chain) {
    threads.Spawn([&, chain]() {
      RunChain(graph, damping_factor, chain_samples[chain], sources[chain],
               chain_tallies[chain]);
    });
  }
  threads.JoinAll();

  std::vector<size_t> tally(graph.NumPages(), 0);
  for (const auto &chain_tally : chain_tallies) {
    for (NodeId page = 0; page < tally.size(); ++page) {
      tally[page] += chain_tally[page];
    }
  }
  return Normalize(tally, samples);
}

} // namespace corpus_rank
