#ifndef __CORPUS_RANK_GRAPH_HH__
#define __CORPUS_RANK_GRAPH_HH__

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace corpus_rank {

using NodeId = size_t;

// Directed link graph of a corpus. Page names are interned to dense ids so
// the estimators can index plain vectors. Link sets never hold duplicates.
class Graph {
public:
  // Page name -> names of the pages it links to.
  using LinkMap = std::map<std::string, std::set<std::string>>;

  Graph() = default;

  // Build a graph with pages numbered in name order.
  // Throws InvalidNode if a page links to a name that is not a key of links.
  static Graph FromLinkMap(const LinkMap &links);

  // Returns the id of name, adding the page if it is new.
  NodeId AddPage(const std::string &name);

  // Adds from -> to. Adding an existing link is a no-op.
  // Throws InvalidNode if either id is unknown.
  void AddLink(NodeId from, NodeId to);

  size_t NumPages() const { return names_.size(); }
  bool Empty() const { return names_.empty(); }
  bool Contains(NodeId id) const { return id < names_.size(); }

  std::optional<NodeId> Find(const std::string &name) const;

  // Like Find, but throws InvalidNode for unknown names.
  NodeId IdOf(const std::string &name) const;

  const std::string &Name(NodeId id) const;

  // Out-links of id, sorted by id.
  const std::vector<NodeId> &Links(NodeId id) const;

  bool HasLink(NodeId from, NodeId to) const;

  // A dangling page has no out-links and is treated as linking everywhere.
  bool IsDangling(NodeId id) const { return Links(id).empty(); }

private:
  void CheckNode(NodeId id) const;

  std::vector<std::string> names_;
  std::unordered_map<std::string, NodeId> index_;
  std::vector<std::vector<NodeId>> links_;
};

} // namespace corpus_rank

#endif
