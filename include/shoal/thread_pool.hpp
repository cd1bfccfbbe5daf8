#ifndef SHOAL_THREAD_POOL_HEADER
#define SHOAL_THREAD_POOL_HEADER

#include <condition_variable>
#include <functional>
#include <thread>
#include <atomic>
#include <vector>
#include <deque>
#include <mutex>

namespace shoal {

/**
 * A bounded pool of worker threads on which the engine runs the work that must stay
 * off the network thread: hashing uploads and writing seed records.
 *
 * Threads are spun up lazily, one per posted job, until `concurrency` threads run.
 * Jobs must not throw; they are expected to report failure through their own
 * completion handlers.
 */
class thread_pool
{
public:
    using job_type = std::function<void()>;

private:
    // Only the owner's thread may change this vector, workers never touch it.
    std::vector<std::thread> threads_;

    // Workers are notified of new jobs via this condition variable while they are
    // holding onto job_queue_mutex_.
    std::condition_variable job_available_;

    // NOTE: must only be handled after acquiring job_queue_mutex_.
    std::deque<job_type> job_queue_;

    mutable std::mutex job_queue_mutex_;

    std::atomic<bool> is_joining_{false};
    std::atomic<int> num_idle_threads_{0};
    std::atomic<int> num_executed_jobs_{0};

    int concurrency_;

public:
    /**
     * If the number of threads is not specified, it is derived from the number of
     * cores of the underlying hardware.
     */
    thread_pool();
    explicit thread_pool(int concurrency);
    ~thread_pool();

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;

    int num_threads() const noexcept;
    int num_idle_threads() const noexcept;
    int num_pending_jobs() const;
    int num_executed_jobs() const noexcept;
    int concurrency() const noexcept;

    /**
     * Queues `job` for execution at an unspecified time. If no thread is idle and the
     * concurrency limit is not yet reached, a new thread is started for it.
     */
    void post(job_type job);

    /** Removes all jobs that are queued up. Does not affect currently executing jobs. */
    void clear_pending_jobs();

    /**
     * Waits for the queued jobs to be executed and stops all threads. Jobs posted
     * after this are run by freshly started threads.
     */
    void join();

private:
    void handle_new_job();
    void run();
};

inline int thread_pool::concurrency() const noexcept
{
    return concurrency_;
}

inline int thread_pool::num_threads() const noexcept
{
    return threads_.size();
}

inline int thread_pool::num_idle_threads() const noexcept
{
    return num_idle_threads_.load(std::memory_order_relaxed);
}

inline int thread_pool::num_executed_jobs() const noexcept
{
    return num_executed_jobs_.load(std::memory_order_relaxed);
}

inline int thread_pool::num_pending_jobs() const
{
    std::lock_guard<std::mutex> l(job_queue_mutex_);
    return job_queue_.size();
}

} // namespace shoal

#endif // SHOAL_THREAD_POOL_HEADER
