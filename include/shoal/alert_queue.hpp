#ifndef SHOAL_ALERT_QUEUE_HEADER
#define SHOAL_ALERT_QUEUE_HEADER

#include "alerts.hpp"

#include <functional>
#include <memory>
#include <deque>
#include <mutex>

namespace shoal {

/**
 * This is the entity through which internal components send notifications to the
 * user of the library, as objects derived from `alert`.
 *
 * It is thread-safe, i.e. the user's thread can safely retrieve the latest alerts
 * while the network thread is adding new ones.
 */
class alert_queue
{
    std::deque<std::unique_ptr<alert>> queue_;
    std::mutex queue_mutex_;

    // If the number of alerts in queue_ reaches this value, new entries will push out
    // the oldest entries in queue_.
    int capacity_;

    // Invoked, outside the lock, after each new alert.
    std::function<void()> notify_;

public:
    explicit alert_queue(const int capacity = 1000) : capacity_(capacity) {}

    /**
     * Sets the function that is called each time an alert is queued. It is called
     * on the thread that posted the alert, which is the network thread.
     */
    void set_notify(std::function<void()> fn) { notify_ = std::move(fn); }

    /** Constructs a new alert in place. */
    template <typename Event, typename... Args>
    void emplace(Args&&... args);

    /**
     * Removes and returns all alerts that have been placed in the queue, oldest
     * first.
     */
    std::deque<std::unique_ptr<alert>> extract_alerts();
};

template <typename Event, typename... Args>
void alert_queue::emplace(Args&&... args)
{
    {
        std::lock_guard<std::mutex> l(queue_mutex_);
        queue_.emplace_back(std::make_unique<Event>(std::forward<Args>(args)...));
        if(capacity_ > 0 && int(queue_.size()) > capacity_) {
            queue_.pop_front();
        }
    }
    if(notify_) {
        notify_();
    }
}

inline std::deque<std::unique_ptr<alert>> alert_queue::extract_alerts()
{
    std::deque<std::unique_ptr<alert>> queue;
    std::lock_guard<std::mutex> l(queue_mutex_);
    queue.swap(queue_);
    return queue;
}

} // namespace shoal

#endif // SHOAL_ALERT_QUEUE_HEADER
