#include "thread_pool.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <atomic>

using namespace shoal;

namespace {

void test_concurrency_bound()
{
    thread_pool pool(2);
    assert(pool.concurrency() == 2);
    assert(pool.num_threads() == 0);

    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<int> num_running{0};
    std::atomic<int> max_running{0};

    for(int i = 0; i < 6; ++i) {
        pool.post([&] {
            const int n = ++num_running;
            int prev = max_running.load();
            while(n > prev && !max_running.compare_exchange_weak(prev, n)) {}
            std::unique_lock<std::mutex> l(mutex);
            cv.wait(l, [&] { return release; });
            --num_running;
        });
    }
    assert(pool.num_threads() <= 2);

    {
        std::lock_guard<std::mutex> l(mutex);
        release = true;
    }
    cv.notify_all();
    pool.join();

    assert(pool.num_executed_jobs() == 6);
    assert(pool.num_pending_jobs() == 0);
    assert(pool.num_threads() == 0);
    assert(max_running.load() <= 2);
}

void test_clearing_pending_jobs()
{
    thread_pool pool(1);
    std::mutex mutex;
    std::condition_variable cv;
    bool started = false;
    bool release = false;
    std::atomic<int> num_run{0};

    pool.post([&] {
        std::unique_lock<std::mutex> l(mutex);
        started = true;
        cv.notify_all();
        cv.wait(l, [&] { return release; });
        ++num_run;
    });
    {
        std::unique_lock<std::mutex> l(mutex);
        cv.wait(l, [&] { return started; });
    }
    for(int i = 0; i < 3; ++i) {
        pool.post([&] { ++num_run; });
    }
    assert(pool.num_pending_jobs() == 3);
    assert(pool.num_idle_threads() == 0);
    pool.clear_pending_jobs();
    assert(pool.num_pending_jobs() == 0);

    {
        std::lock_guard<std::mutex> l(mutex);
        release = true;
    }
    cv.notify_all();
    pool.join();
    assert(num_run == 1);

    // the pool is usable after being joined
    pool.post([&] { ++num_run; });
    pool.join();
    assert(num_run == 2);
}

} // namespace

int main()
{
    test_concurrency_bound();
    test_clearing_pending_jobs();
}
