#include "report.hh"
#include <algorithm>
#include <iomanip>
#include <stdexcept>
#include <string>

namespace corpus_rank {

std::map<std::string, double> NamedRanks(const Graph &graph,
                                         const Distribution &ranks) {
  if (ranks.size() != graph.NumPages()) {
    throw std::invalid_argument("Ranks cover " + std::to_string(ranks.size()) +
                                " pages, graph has " +
                                std::to_string(graph.NumPages()));
  }
  std::map<std::string, double> named;
  for (NodeId page = 0; page < graph.NumPages(); ++page) {
    named.emplace(graph.Name(page), ranks[page]);
  }
  return named;
}

void PrintRanks(std::ostream &os, const std::string &title,
                const Graph &graph, const Distribution &ranks) {
  os << title << "\n";
  for (const auto &[page, rank] : NamedRanks(graph, ranks)) {
    os << "  " << page << ": " << std::fixed << std::setprecision(4) << rank
       << "\n";
  }
}

std::vector<std::pair<NodeId, double>> TopPages(const Distribution &ranks,
                                                size_t n) {
  std::vector<std::pair<NodeId, double>> pages;
  pages.reserve(ranks.size());
  for (NodeId page = 0; page < ranks.size(); ++page) {
    pages.emplace_back(page, ranks[page]);
  }

  // Sort by rank, ties by id
  std::partial_sort(
      pages.begin(),
      pages.begin() + static_cast<long>(std::min(n, pages.size())),
      pages.end(),
      [](const auto &a, const auto &b) {
        return a.second > b.second ||
               (a.second == b.second && a.first < b.first);
      });

  pages.resize(std::min(n, pages.size()));
  return pages;
}

} // namespace corpus_rank
