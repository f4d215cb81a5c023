#pragma once

#include <atomic>
#include <functional>

namespace hid {

// Execute fn(index) for index = 0..total-1 on at most `concurrency` worker
// threads; each worker pulls the next free index. If concurrency <= 1, runs
// sequentially on the calling thread. All tasks complete before returning.
void for_each_index(int total, int concurrency, const std::function<void(int)>& fn);

// Simple cancellation handle
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Cancellation-aware variant.
// - Once `cancel` is set no further index is handed out; `skipped(index)` is
//   called for every index that never started.
// - Exceptions thrown from fn cancel the run and the first one is rethrown
//   after all workers join.
void for_each_index_cancelable(
    int total,
    int concurrency,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel = nullptr,
    const std::function<void(int)>& skipped = {});

} // namespace hid
