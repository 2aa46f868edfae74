#ifndef __CORPUS_RANK_REPORT_HH__
#define __CORPUS_RANK_REPORT_HH__

#include "distribution.hh"
#include "graph.hh"
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace corpus_rank {

// Page name -> rank, ordered by name.
// Throws std::invalid_argument if ranks does not cover every page of graph.
std::map<std::string, double> NamedRanks(const Graph &graph,
                                         const Distribution &ranks);

// Writes title followed by one "  <page>: <rank>" line per page.
void PrintRanks(std::ostream &os, const std::string &title,
                const Graph &graph, const Distribution &ranks);

// The n highest ranked pages, best first.
std::vector<std::pair<NodeId, double>> TopPages(const Distribution &ranks,
                                                size_t n);

} // namespace corpus_rank

#endif
