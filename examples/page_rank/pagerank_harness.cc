#include "corpus_rank/iterative_estimator.hh"
#include "corpus_rank/random_source.hh"
#include "corpus_rank/report.hh"
#include "corpus_rank/sample_estimator.hh"
#include "corpus_rank/transition_model.hh"
#include "random_corpus.hh"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>

void print_usage(const char *program_name) {
  std::cerr << "Usage: " << program_name << " <random_seed>\n";
  std::cerr << "  random_seed: Unsigned integer for RNG initialization\n";
}

int main(int argc, char *argv[]) {
  using namespace corpus_rank;

  if (argc != 2) {
    print_usage(argv[0]);
    return 1;
  }

  // Parse random seed
  uint64_t seed;
  try {
    seed = std::stoull(argv[1]);
  } catch (const std::exception &e) {
    std::cerr << "Error: Invalid random seed\n";
    print_usage(argv[0]);
    return 1;
  }

  constexpr size_t NUM_PAGES = 500;
  constexpr double EDGE_PROBABILITY =
      0.01; // 1% chance of edge between any two pages
  constexpr size_t NUM_SAMPLES = 200000;
  constexpr size_t MAX_ITERATIONS = 100;

  std::mt19937_64 rng(seed);
  Graph corpus = GenerateRandomCorpus(NUM_PAGES, EDGE_PROBABILITY, rng);

  // Iterative estimate
  auto start_time = std::chrono::steady_clock::now();
  IterativeEstimator estimator(corpus, kDefaultDampingFactor, 1e-10);
  const Distribution &iterated = estimator.Run(MAX_ITERATIONS);
  auto end_time = std::chrono::steady_clock::now();
  auto iterate_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        end_time - start_time)
                        .count();

  // Sampled estimate
  Mt19937RandomSource random(seed);
  start_time = std::chrono::steady_clock::now();
  Distribution sampled =
      SamplePageRank(corpus, kDefaultDampingFactor, NUM_SAMPLES, random);
  end_time = std::chrono::steady_clock::now();
  auto sample_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                       end_time - start_time)
                       .count();

  std::cout << "Iterative PageRank Results:\n";
  std::cout << "Iterations to converge: " << estimator.Iterations() << "\n";
  std::cout << "Time to converge: " << iterate_ms << "ms\n";
  std::cout << "Time to sample " << NUM_SAMPLES << " pages: " << sample_ms
            << "ms\n";
  std::cout << "L1 distance between estimates: " << std::fixed
            << std::setprecision(6) << sampled.L1Distance(iterated) << "\n\n";

  std::cout << "Top 10 pages:\n";
  for (const auto &[id, rank] : TopPages(iterated, 10)) {
    std::cout << std::setw(14) << corpus.Name(id) << ": " << std::fixed
              << std::setprecision(6) << rank << " (sampled " << sampled[id]
              << ")\n";
  }

  // Detect non-convergence
  if (!estimator.Converged()) {
    std::cout
        << "\nWARNING: Algorithm hit iteration limit without converging\n";
  }

  return 0;
}
