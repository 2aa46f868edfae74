// tests/graph_test.cc
#include "corpus_rank/distribution.hh"
#include "corpus_rank/errors.hh"
#include "corpus_rank/graph.hh"

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace corpus_rank {
namespace {

TEST(GraphTest, FromLinkMapNumbersPagesByName) {
  Graph graph = Graph::FromLinkMap(
      {{"c.html", {"a.html"}}, {"a.html", {"b.html", "c.html"}}, {"b.html", {}}});

  ASSERT_EQ(graph.NumPages(), 3u);
  EXPECT_EQ(graph.Name(0), "a.html");
  EXPECT_EQ(graph.Name(1), "b.html");
  EXPECT_EQ(graph.Name(2), "c.html");
  EXPECT_EQ(graph.Links(0), (std::vector<NodeId>{1, 2}));
  EXPECT_TRUE(graph.IsDangling(1));
  EXPECT_TRUE(graph.HasLink(2, 0));
  EXPECT_FALSE(graph.HasLink(0, 0));
}

TEST(GraphTest, FromLinkMapRejectsLinkToUnknownPage) {
  EXPECT_THROW(Graph::FromLinkMap({{"a.html", {"missing.html"}}}),
               InvalidNode);
}

TEST(GraphTest, AddPageIsIdempotent) {
  Graph graph;
  NodeId a = graph.AddPage("a");
  NodeId b = graph.AddPage("b");
  EXPECT_NE(a, b);
  EXPECT_EQ(graph.AddPage("a"), a);
  EXPECT_EQ(graph.NumPages(), 2u);
}

TEST(GraphTest, AddLinkCollapsesDuplicatesAndSorts) {
  Graph graph;
  NodeId a = graph.AddPage("a");
  NodeId b = graph.AddPage("b");
  NodeId c = graph.AddPage("c");
  graph.AddLink(a, c);
  graph.AddLink(a, b);
  graph.AddLink(a, c);

  EXPECT_EQ(graph.Links(a), (std::vector<NodeId>{b, c}));
  EXPECT_FALSE(graph.IsDangling(a));
}

TEST(GraphTest, AllowsSelfLinks) {
  Graph graph;
  NodeId a = graph.AddPage("a");
  graph.AddLink(a, a);
  EXPECT_TRUE(graph.HasLink(a, a));
}

TEST(GraphTest, UnknownIdsAndNamesThrow) {
  Graph graph;
  NodeId a = graph.AddPage("a");

  EXPECT_THROW(graph.AddLink(a, 7), InvalidNode);
  EXPECT_THROW(graph.Links(1), InvalidNode);
  EXPECT_THROW(graph.Name(3), InvalidNode);
  EXPECT_THROW(graph.IdOf("b"), InvalidNode);
  EXPECT_FALSE(graph.Find("b").has_value());
  EXPECT_EQ(graph.IdOf("a"), a);
}

TEST(GraphTest, EmptyGraph) {
  Graph graph;
  EXPECT_TRUE(graph.Empty());
  EXPECT_EQ(graph.NumPages(), 0u);
  EXPECT_FALSE(graph.Contains(0));
}

TEST(DistributionTest, SumAndDistances) {
  Distribution p(3);
  p[0] = 0.5;
  p[1] = 0.25;
  p[2] = 0.25;
  Distribution q(3, 1.0 / 3.0);

  EXPECT_DOUBLE_EQ(p.Sum(), 1.0);
  EXPECT_NEAR(q.Sum(), 1.0, 1e-12);
  EXPECT_NEAR(p.MaxAbsDelta(q), 0.5 - 1.0 / 3.0, 1e-12);
  EXPECT_NEAR(p.L1Distance(q), 2 * (0.5 - 1.0 / 3.0), 1e-12);
  EXPECT_DOUBLE_EQ(p.L1Distance(p), 0.0);
}

TEST(DistributionTest, MismatchedSizesThrow) {
  Distribution p(2, 0.5);
  Distribution q(3, 1.0 / 3.0);
  EXPECT_THROW(p.L1Distance(q), std::invalid_argument);
  EXPECT_THROW(p.MaxAbsDelta(q), std::invalid_argument);
}

} // namespace
} // namespace corpus_rank

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
