#include "graph.hh"
#include "errors.hh"
#include <algorithm>

namespace corpus_rank {

Graph Graph::FromLinkMap(const LinkMap &links) {
  Graph graph;
  for (const auto &[page, _] : links) {
    graph.AddPage(page);
  }

  for (const auto &[page, targets] : links) {
    NodeId from = graph.IdOf(page);
    for (const auto &target : targets) {
      auto to = graph.Find(target);
      if (!to.has_value()) {
        throw InvalidNode("Page '" + page + "' links to unknown page '" +
                          target + "'");
      }
      graph.AddLink(from, *to);
    }
  }
  return graph;
}

NodeId Graph::AddPage(const std::string &name) {
  if (auto it = index_.find(name); it != index_.end()) {
    return it->second;
  }
  NodeId id = names_.size();
  names_.push_back(name);
  links_.emplace_back();
  index_.emplace(name, id);
  return id;
}

void Graph::AddLink(NodeId from, NodeId to) {
  CheckNode(from);
  CheckNode(to);
  auto &links = links_[from];
  auto it = std::lower_bound(links.begin(), links.end(), to);
  if (it == links.end() || *it != to) {
    links.insert(it, to);
  }
}

std::optional<NodeId> Graph::Find(const std::string &name) const {
  if (auto it = index_.find(name); it != index_.end()) {
    return it->second;
  }
  return std::nullopt;
}

NodeId Graph::IdOf(const std::string &name) const {
  auto id = Find(name);
  if (!id.has_value()) {
    throw InvalidNode("Unknown page '" + name + "'");
  }
  return *id;
}

const std::string &Graph::Name(NodeId id) const {
  CheckNode(id);
  return names_[id];
}

const std::vector<NodeId> &Graph::Links(NodeId id) const {
  CheckNode(id);
  return links_[id];
}

bool Graph::HasLink(NodeId from, NodeId to) const {
  const auto &links = Links(from);
  return std::binary_search(links.begin(), links.end(), to);
}

void Graph::CheckNode(NodeId id) const {
  if (!Contains(id)) {
    throw InvalidNode("Page id " + std::to_string(id) +
                      " is not in a graph of " + std::to_string(NumPages()) +
                      " pages");
  }
}

} // namespace corpus_rank
