#include "hid/concurrency.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace hid {

void for_each_index(int total, int concurrency, const std::function<void(int)>& fn)
{
    for_each_index_cancelable(
        total, concurrency,
        [&](int idx, const std::atomic<bool>&) { fn(idx); });
}

void for_each_index_cancelable(
    int total,
    int concurrency,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel,
    const std::function<void(int)>& skipped)
{
    if (total <= 0) return;

    std::atomic<bool> local_cancel{false};
    const std::atomic<bool>& flag = cancel ? cancel->flag() : local_cancel;

    std::mutex ex_mtx;
    std::exception_ptr first_ex = nullptr;

    std::atomic<int> next{0};
    auto worker = [&]
    {
        for (;;)
        {
            if (flag.load(std::memory_order_relaxed)) return;
            const int idx = next.fetch_add(1, std::memory_order_relaxed);
            if (idx >= total) return;
            try {
                fn(idx, flag);
            } catch (...) {
                {
                    std::scoped_lock lk(ex_mtx);
                    if (!first_ex) first_ex = std::current_exception();
                }
                if (cancel) cancel->cancel(); else local_cancel.store(true, std::memory_order_relaxed);
            }
        }
    };

    const int workers = std::min(concurrency, total);
    if (workers <= 1)
    {
        worker();
    }
    else
    {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (int i = 0; i < workers; ++i) threads.emplace_back(worker);
        for (auto& th : threads) if (th.joinable()) th.join();
    }

    // every index at or past `next` was never handed out
    if (skipped)
    {
        for (int i = std::min(next.load(), total); i < total; ++i) skipped(i);
    }

    if (first_ex) std::rethrow_exception(first_ex);
}

} // namespace hid
