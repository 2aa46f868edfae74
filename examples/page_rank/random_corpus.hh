#ifndef RANDOM_CORPUS_H_
#define RANDOM_CORPUS_H_

#include "corpus_rank/graph.hh"
#include <cstddef>
#include <random>

namespace corpus_rank {

// Create a random web graph of num_pages pages named "page<i>.html". Every
// ordered pair of distinct pages is linked with probability
// edge_probability, so some pages may end up dangling.
Graph GenerateRandomCorpus(size_t num_pages, double edge_probability,
                           std::mt19937_64 &rng);

} // namespace corpus_rank

#endif // RANDOM_CORPUS_H_
