#ifndef __CORPUS_RANK_ERRORS_HH__
#define __CORPUS_RANK_ERRORS_HH__

#include <stdexcept>
#include <string>

namespace corpus_rank {

// Base for contract violations by callers of the ranking core. These are
// raised before any computation starts and never carry partial results.
class RankError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Page id or name is not part of the graph.
class InvalidNode : public RankError {
public:
  using RankError::RankError;
};

// Sample count below 1.
class InvalidSampleCount : public RankError {
public:
  using RankError::RankError;
};

// Convergence threshold not strictly positive.
class InvalidThreshold : public RankError {
public:
  using RankError::RankError;
};

// Graph with no pages to rank.
class EmptyGraph : public RankError {
public:
  using RankError::RankError;
};

// Damping factor outside (0, 1).
class InvalidDampingFactor : public RankError {
public:
  using RankError::RankError;
};

// Failure reading a corpus directory from disk.
class CorpusError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace corpus_rank

#endif
