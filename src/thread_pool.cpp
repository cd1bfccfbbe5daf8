#include "thread_pool.hpp"

namespace shoal {

inline int auto_concurrency()
{
    const int n = std::thread::hardware_concurrency();
    return n > 0 ? n : 2;
}

thread_pool::thread_pool() : thread_pool(auto_concurrency()) {}

thread_pool::thread_pool(int concurrency)
    : concurrency_(concurrency <= 0 ? auto_concurrency() : concurrency)
{}

thread_pool::~thread_pool()
{
    join();
}

void thread_pool::post(job_type job)
{
    std::unique_lock<std::mutex> l(job_queue_mutex_);
    job_queue_.emplace_back(std::move(job));
    l.unlock();
    handle_new_job();
}

void thread_pool::clear_pending_jobs()
{
    std::lock_guard<std::mutex> l(job_queue_mutex_);
    job_queue_.clear();
}

void thread_pool::join()
{
    {
        std::lock_guard<std::mutex> l(job_queue_mutex_);
        is_joining_.store(true, std::memory_order_release);
    }
    job_available_.notify_all();
    for(auto& thread : threads_) {
        if(thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    num_idle_threads_.store(0, std::memory_order_relaxed);
    is_joining_.store(false, std::memory_order_release);
}

inline void thread_pool::handle_new_job()
{
    if(num_idle_threads_.load(std::memory_order_acquire) == 0
            && num_threads() < concurrency_) {
        threads_.emplace_back([this] { run(); });
    }
    job_available_.notify_one();
}

void thread_pool::run()
{
    std::unique_lock<std::mutex> job_queue_lock(job_queue_mutex_);
    while(true) {
        num_idle_threads_.fetch_add(1, std::memory_order_release);
        // wake up if the pool is being joined or a new job is available
        job_available_.wait(job_queue_lock, [this] {
            return is_joining_.load(std::memory_order_acquire) || !job_queue_.empty();
        });
        num_idle_threads_.fetch_sub(1, std::memory_order_release);

        // queued jobs are drained before a joining thread exits
        if(job_queue_.empty()) {
            break;
        }

        auto job = std::move(job_queue_.front());
        job_queue_.pop_front();
        job_queue_lock.unlock();
        job();
        num_executed_jobs_.fetch_add(1, std::memory_order_relaxed);
        job_queue_lock.lock();
    }
}

} // namespace shoal
