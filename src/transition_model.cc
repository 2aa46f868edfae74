#include "transition_model.hh"
#include "errors.hh"
#include <string>

namespace corpus_rank {

void ValidateDampingFactor(double damping_factor) {
  // Also rejects NaN
  if (!(damping_factor > 0.0 && damping_factor < 1.0)) {
    throw InvalidDampingFactor("Damping factor must be between 0 and 1, got " +
                               std::to_string(damping_factor));
  }
}

Distribution TransitionModel(const Graph &graph, NodeId page,
                             double damping_factor) {
  if (!graph.Contains(page)) {
    throw InvalidNode("Cannot compute transitions from page id " +
                      std::to_string(page) + ": not in graph");
  }
  ValidateDampingFactor(damping_factor);

  const auto num_pages = static_cast<double>(graph.NumPages());
  const auto &links = graph.Links(page);

  // Random jump to any page
  Distribution model(graph.NumPages(), (1.0 - damping_factor) / num_pages);

  if (links.empty()) {
    for (NodeId p = 0; p < graph.NumPages(); ++p) {
      model[p] += damping_factor / num_pages;
    }
    return model;
  }

  const double prob_linked =
      damping_factor / static_cast<double>(links.size());
  for (NodeId target : links) {
    model[target] += prob_linked;
  }
  return model;
}

} // namespace corpus_rank
