#include "random_corpus.hh"

#include <string>

namespace corpus_rank {

Graph GenerateRandomCorpus(size_t num_pages, double edge_probability,
                           std::mt19937_64 &rng) {
  std::uniform_real_distribution<> dist(0.0, 1.0);

  Graph graph;
  for (size_t i = 0; i < num_pages; ++i) {
    graph.AddPage("page" + std::to_string(i) + ".html");
  }

  // Create random edges
  for (NodeId page = 0; page < num_pages; ++page) {
    for (NodeId target = 0; target < num_pages; ++target) {
      if (page != target && dist(rng) < edge_probability) {
        graph.AddLink(page, target);
      }
    }
  }
  return graph;
}

} // namespace corpus_rank
