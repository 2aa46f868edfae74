#ifndef __CORPUS_RANK_TRANSITION_MODEL_HH__
#define __CORPUS_RANK_TRANSITION_MODEL_HH__

#include "distribution.hh"
#include "graph.hh"

namespace corpus_rank {

constexpr double kDefaultDampingFactor = 0.85;

// Throws InvalidDampingFactor unless 0 < damping_factor < 1.
void ValidateDampingFactor(double damping_factor);

// Probability of moving from page to every page of graph in one step of the
// random surfer. With probability damping_factor a link of page is followed,
// otherwise a page is picked uniformly. A page without links is treated as
// linking to every page, itself included.
//
// Throws InvalidNode if page is not in graph, InvalidDampingFactor if the
// damping factor is out of range.
Distribution TransitionModel(const Graph &graph, NodeId page,
                             double damping_factor);

} // namespace corpus_rank

#endif
