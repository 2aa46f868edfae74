#include "cli.hh"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

namespace corpus_rank {
void SetupLogging(const LoggingOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (!options.log_file.empty()) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          options.log_file, true);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      sinks.push_back(file_sink);
    }

    // Console sink only if verbose mode is enabled
    if (options.verbose) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("corpus_rank", sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    exit(1);
  }
}

void AddLoggingOptions(CLI::App &app, LoggingOptions &options) {
  app.add_flag("-v,--verbose", options.verbose,
               "Enable verbose console output");
  app.add_option("-l,--log-file", options.log_file,
                 "Log file path (no file log if empty)");

  app.add_option("--log-level", options.log_level,
                 "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));
}

void AddRankOptions(CLI::App &app, RankOptions &options) {
  AddLoggingOptions(app, options);

  app.add_option("corpus", options.corpus_dir,
                 "Directory of .html pages to rank")
      ->check(CLI::ExistingDirectory)
      ->required();

  app.add_option("-d,--damping", options.damping_factor,
                 "Probability of following a link (0.0-1.0, exclusive)")
      ->default_val(0.85)
      ->check(CLI::Range(0.0, 1.0));

  app.add_option("-n,--samples", options.samples,
                 "Number of pages visited by the random surfer")
      ->default_val(10000)
      ->check(CLI::PositiveNumber);

  app.add_option("-t,--threshold", options.threshold,
                 "Convergence threshold for the iterative estimate")
      ->default_val(0.001)
      ->check(CLI::PositiveNumber);

  app.add_option("--seed", options.seed,
                 "RNG seed for sampling (0 for random)")
      ->default_val(0);

  app.add_option("--chains", options.num_chains,
                 "Number of independent sampling chains")
      ->default_val(1)
      ->check(CLI::Range(1, 256));

  app.add_option("--threads", options.num_threads,
                 "Number of threads for the iterative estimate")
      ->default_val(1)
      ->check(CLI::Range(1, 256));

  app.add_option("--max-iterations", options.max_iterations,
                 "Maximum number of iterative passes")
      ->default_val(std::numeric_limits<size_t>::max())
      ->check(CLI::PositiveNumber);
}

} // namespace corpus_rank
