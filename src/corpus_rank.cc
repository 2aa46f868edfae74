#include "cli.hh"
#include "corpus_crawler.hh"
#include "errors.hh"
#include "iterative_estimator.hh"
#include "random_source.hh"
#include "report.hh"
#include "sample_estimator.hh"
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

namespace {
using namespace corpus_rank;

int Run(const RankOptions &options) {
  Graph corpus = LoadCorpus(options.corpus_dir);
  spdlog::info("Ranking {} pages (damping {}, {} samples, threshold {})",
               corpus.NumPages(), options.damping_factor, options.samples,
               options.threshold);

  Distribution sampled;
  if (options.num_chains > 1) {
    sampled = SamplePageRankChains(corpus, options.damping_factor,
                                   options.samples, options.num_chains,
                                   options.seed);
  } else {
    Mt19937RandomSource random(options.seed);
    spdlog::info("Sampling with seed {}", random.Seed());
    sampled = SamplePageRank(corpus, options.damping_factor, options.samples,
                             random);
  }
  PrintRanks(std::cout,
             "PageRank Results from Sampling (n = " +
                 std::to_string(options.samples) + ")",
             corpus, sampled);

  IterativeEstimator estimator(corpus, options.damping_factor,
                               options.threshold, options.num_threads);
  const Distribution &iterated = estimator.Run(options.max_iterations);
  PrintRanks(std::cout, "PageRank Results from Iteration", corpus, iterated);

  if (!estimator.Converged()) {
    std::cout << "\nWARNING: Iteration hit the limit of "
              << options.max_iterations << " passes without converging\n";
  }
  spdlog::info("L1 distance between estimates: {:.4f}",
               sampled.L1Distance(iterated));
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"corpus_rank - PageRank of a directory of linked pages"};
  RankOptions options;
  AddRankOptions(app, options);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  SetupLogging(options);

  try {
    return Run(options);
  } catch (const RankError &e) {
    spdlog::error("Invalid ranking input: {}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
  } catch (const CorpusError &e) {
    spdlog::error("Failed to load corpus: {}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
  }
  return 1;
}
