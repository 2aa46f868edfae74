// tests/transition_model_test.cc
#include "corpus_rank/errors.hh"
#include "corpus_rank/transition_model.hh"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

namespace corpus_rank {
namespace {

class TransitionModelTest : public ::testing::Test {
protected:
  void SetUp() override {
    // a -> {b, c}, b -> c, c -> a, d dangling
    graph_ = Graph::FromLinkMap({{"a", {"b", "c"}},
                                 {"b", {"c"}},
                                 {"c", {"a"}},
                                 {"d", {}}});
    a_ = graph_.IdOf("a");
    b_ = graph_.IdOf("b");
    c_ = graph_.IdOf("c");
    d_ = graph_.IdOf("d");
  }

  Graph graph_;
  NodeId a_, b_, c_, d_;
};

TEST_F(TransitionModelTest, SplitsDampedMassOverLinks) {
  auto model = TransitionModel(graph_, a_, 0.85);

  ASSERT_EQ(model.size(), 4u);
  EXPECT_NEAR(model[a_], 0.0375, 1e-12);
  EXPECT_NEAR(model[b_], 0.0375 + 0.425, 1e-12);
  EXPECT_NEAR(model[c_], 0.0375 + 0.425, 1e-12);
  EXPECT_NEAR(model[d_], 0.0375, 1e-12);
}

TEST_F(TransitionModelTest, DanglingPageIsUniform) {
  auto model = TransitionModel(graph_, d_, 0.85);
  for (NodeId page = 0; page < graph_.NumPages(); ++page) {
    EXPECT_NEAR(model[page], 0.25, 1e-12) << "page " << graph_.Name(page);
  }
}

TEST_F(TransitionModelTest, SumsToOneForEveryPageAndDamping) {
  for (double damping : {0.01, 0.5, 0.85, 0.99}) {
    for (NodeId page = 0; page < graph_.NumPages(); ++page) {
      EXPECT_NEAR(TransitionModel(graph_, page, damping).Sum(), 1.0, 1e-9)
          << "page " << graph_.Name(page) << ", damping " << damping;
    }
  }
}

TEST_F(TransitionModelTest, SelfLinkReceivesLinkMass) {
  Graph graph;
  NodeId x = graph.AddPage("x");
  NodeId y = graph.AddPage("y");
  graph.AddLink(x, x);

  auto model = TransitionModel(graph, x, 0.5);
  EXPECT_NEAR(model[x], 0.25 + 0.5, 1e-12);
  EXPECT_NEAR(model[y], 0.25, 1e-12);
}

TEST_F(TransitionModelTest, SinglePageModel) {
  Graph graph;
  NodeId only = graph.AddPage("only");
  auto model = TransitionModel(graph, only, 0.85);
  ASSERT_EQ(model.size(), 1u);
  EXPECT_NEAR(model[only], 1.0, 1e-12);
}

TEST_F(TransitionModelTest, UnknownPageThrows) {
  EXPECT_THROW(TransitionModel(graph_, 4, 0.85), InvalidNode);
  EXPECT_THROW(TransitionModel(Graph(), 0, 0.85), InvalidNode);
}

TEST_F(TransitionModelTest, DampingOutsideOpenIntervalThrows) {
  EXPECT_THROW(TransitionModel(graph_, a_, 0.0), InvalidDampingFactor);
  EXPECT_THROW(TransitionModel(graph_, a_, 1.0), InvalidDampingFactor);
  EXPECT_THROW(TransitionModel(graph_, a_, -0.2), InvalidDampingFactor);
  EXPECT_THROW(TransitionModel(graph_, a_,
                               std::numeric_limits<double>::quiet_NaN()),
               InvalidDampingFactor);
  EXPECT_NO_THROW(ValidateDampingFactor(0.85));
}

} // namespace
} // namespace corpus_rank

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
