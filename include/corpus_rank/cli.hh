#ifndef __CORPUS_RANK_CLI_HH__
#define __CORPUS_RANK_CLI_HH__
#include "CLI/App.hpp"
#include "spdlog/common.h"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace corpus_rank {

struct LoggingOptions {
  bool verbose{false};
  std::string log_file;
  spdlog::level::level_enum log_level{spdlog::level::info};
};

struct RankOptions : LoggingOptions {
  std::string corpus_dir;
  double damping_factor{0.85};
  size_t samples{10000};
  double threshold{0.001};
  uint64_t seed{0};
  size_t num_chains{1};
  size_t num_threads{1};
  size_t max_iterations{std::numeric_limits<size_t>::max()};
};

void AddLoggingOptions(CLI::App &app, LoggingOptions &options);
void AddRankOptions(CLI::App &app, RankOptions &options);
void SetupLogging(const LoggingOptions &options);

} // namespace corpus_rank
#endif
