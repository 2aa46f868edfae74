#include "thread_group.hh"

namespace corpus_rank {

ThreadGroup::~ThreadGroup() { JoinAll(); }

void ThreadGroup::JoinAll() {
  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

} // namespace corpus_rank
