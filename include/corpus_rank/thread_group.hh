#ifndef __CORPUS_RANK_THREAD_GROUP_HH__
#define __CORPUS_RANK_THREAD_GROUP_HH__

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace corpus_rank {

// Owns worker threads and joins every one that was started when it goes out
// of scope, also when a later thread fails to start.
class ThreadGroup {
public:
  ThreadGroup() = default;
  ~ThreadGroup();

  // Prevent copying and assignment
  ThreadGroup(const ThreadGroup &) = delete;
  ThreadGroup &operator=(const ThreadGroup &) = delete;

  template <typename Function> void Spawn(Function &&function) {
    threads_.emplace_back(std::forward<Function>(function));
  }

  // Wait for all threads
  void JoinAll();

  size_t size() const { return threads_.size(); }

private:
  std::vector<std::thread> threads_;
};

} // namespace corpus_rank

#endif
