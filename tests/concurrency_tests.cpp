#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <vector>

#include "hid/concurrency.hpp"

using namespace hid;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void test_call_count_seq_par()
{ {
        std::atomic<int> c{0};
        for_each_index(
            17,
            1,
            [&](int) { c.fetch_add(1, std::memory_order_relaxed); });
        assert_true(c.load() == 17, "seq: call count == total");
    } {
        std::atomic<int> c{0};
        for_each_index(
            101,
            4,
            [&](int) { c.fetch_add(1, std::memory_order_relaxed); });
        assert_true(c.load() == 101, "par: call count == total");
    }
}

static void test_every_index_exactly_once()
{
    std::mutex mtx;
    std::multiset<int> seen;
    for_each_index(
        64,
        8,
        [&](int idx)
        {
            std::scoped_lock lk(mtx);
            seen.insert(idx);
        });
    assert_true(seen.size() == 64, "64 calls");
    for (int i = 0; i < 64; ++i)
    {
        assert_true(seen.count(i) == 1, "index visited once");
    }
}

static void test_cancelable_exception_propagation()
{
    std::atomic<int> c{0};
    bool caught = false;
    try
    {
        for_each_index_cancelable(
            50,
            5,
            [&](int idx, const std::atomic<bool> &)
            {
                if (idx == 13) throw std::runtime_error("boom");
                c.fetch_add(1, std::memory_order_relaxed);
            });
    }
    catch (const std::runtime_error &e)
    {
        caught = std::string_view(e.what()) == "boom";
    }
    assert_true(caught, "first exception rethrown");
    assert_true(c.load() <= 49, "failing index not counted");
}

static void test_external_cancel_reports_skipped()
{
    Cancellation cancel;
    std::atomic<int> ran{0};
    std::vector<int> skipped;
    for_each_index_cancelable(
        20,
        1,
        [&](int idx, const std::atomic<bool> &)
        {
            ran.fetch_add(1, std::memory_order_relaxed);
            if (idx == 4) cancel.cancel();
        },
        &cancel,
        [&](int idx) { skipped.push_back(idx); });
    assert_true(ran.load() == 5, "indices 0..4 ran");
    assert_true(skipped.size() == 15, "15 indices skipped");
    assert_true(skipped.front() == 5 && skipped.back() == 19,
                "skipped range is 5..19");
}

static void test_cancelled_before_start()
{
    Cancellation cancel;
    cancel.cancel();
    std::atomic<int> ran{0};
    std::atomic<int> skipped{0};
    for_each_index_cancelable(
        10,
        3,
        [&](int, const std::atomic<bool> &) { ran.fetch_add(1); },
        &cancel,
        [&](int) { skipped.fetch_add(1); });
    assert_true(ran.load() == 0, "nothing ran");
    assert_true(skipped.load() == 10, "all skipped");
}

static void test_parallel_cancel_accounts_for_every_index()
{
    Cancellation cancel;
    std::atomic<int> ran{0};
    std::atomic<int> skipped{0};
    for_each_index_cancelable(
        200,
        4,
        [&](int idx, const std::atomic<bool> &)
        {
            ran.fetch_add(1);
            if (idx == 10) cancel.cancel();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        },
        &cancel,
        [&](int) { skipped.fetch_add(1); });
    assert_true(ran.load() + skipped.load() == 200,
                "ran + skipped == total");
    assert_true(skipped.load() > 0, "some indices skipped");
}

static void test_total_zero()
{
    std::atomic<int> c{0};
    for_each_index(0, 4, [&](int) { c.fetch_add(1); });
    for_each_index(-3, 4, [&](int) { c.fetch_add(1); });
    assert_true(c.load() == 0, "no calls for total <= 0");
}

static void test_concurrency_le1_runs_on_caller()
{
    const auto caller = std::this_thread::get_id();
    bool same = true;
    for_each_index(
        5,
        0,
        [&](int) { same = same && std::this_thread::get_id() == caller; });
    assert_true(same, "concurrency 0 runs on caller thread");
}

static void test_over_parallelism()
{
    std::atomic<int> c{0};
    for_each_index(3, 16, [&](int) { c.fetch_add(1); });
    assert_true(c.load() == 3, "workers capped by total");
}

static void test_cancel_idempotent()
{
    Cancellation c;
    assert_true(!c.is_cancelled(), "initially not cancelled");
    c.cancel();
    c.cancel();
    assert_true(c.is_cancelled(), "cancelled after cancel()");
}

int main()
{
    test_call_count_seq_par();
    test_every_index_exactly_once();
    test_cancelable_exception_propagation();
    test_external_cancel_reports_skipped();
    test_cancelled_before_start();
    test_parallel_cancel_accounts_for_every_index();
    test_total_zero();
    test_concurrency_le1_runs_on_caller();
    test_over_parallelism();
    test_cancel_idempotent();

    std::cout << "concurrency tests: OK" << std::endl;
    return 0;
}
