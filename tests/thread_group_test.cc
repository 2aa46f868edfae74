// tests/thread_group_test.cc
#include "corpus_rank/thread_group.hh"

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>

namespace corpus_rank {
namespace {

TEST(ThreadGroupTest, JoinAllWaitsForEveryThread) {
  std::atomic<int> finished{0};
  ThreadGroup threads;
  for (int i = 0; i < 8; ++i) {
    threads.Spawn([&finished]() { finished.fetch_add(1); });
  }
  EXPECT_EQ(threads.size(), 8u);

  threads.JoinAll();
  EXPECT_EQ(finished.load(), 8);
  EXPECT_EQ(threads.size(), 0u);
}

TEST(ThreadGroupTest, JoinsStartedThreadsWhenUnwinding) {
  std::atomic<int> finished{0};
  try {
    ThreadGroup threads;
    for (int i = 0; i < 4; ++i) {
      threads.Spawn([&finished]() { finished.fetch_add(1); });
    }
    throw std::runtime_error("thread start failed");
  } catch (const std::runtime_error &) {
    // Reaching here without std::terminate means every thread was joined
  }
  EXPECT_EQ(finished.load(), 4);
}

TEST(ThreadGroupTest, JoinAllIsRepeatable) {
  ThreadGroup threads;
  threads.JoinAll();
  threads.Spawn([]() {});
  threads.JoinAll();
  threads.JoinAll();
  EXPECT_EQ(threads.size(), 0u);
}

} // namespace
} // namespace corpus_rank

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
