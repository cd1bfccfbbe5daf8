#ifndef SHOAL_TIME_HEADER
#define SHOAL_TIME_HEADER

#include <chrono>
#include <cstdint>

#include <asio/basic_waitable_timer.hpp>

namespace shoal {

using clock = std::chrono::steady_clock;

using time_point = clock::time_point;
using duration = clock::duration;

using std::chrono::hours;
using std::chrono::microseconds;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

using std::chrono::duration_cast;
using std::chrono::time_point_cast;

using deadline_timer = asio::basic_waitable_timer<clock>;

// Wall clock time is only used for durable timestamps, which must survive restarts.
using system_clock = std::chrono::system_clock;
using system_time_point = system_clock::time_point;

/** Milliseconds since the UNIX epoch, as stored in seed records. */
inline int64_t to_unix_millis(const system_time_point& t)
{
    return duration_cast<milliseconds>(t.time_since_epoch()).count();
}

template <typename Duration, typename Handler>
void start_timer(deadline_timer& timer, const Duration& expires_in, Handler handler)
{
    // Setting this cancels pending async waits (which is what we want).
    timer.expires_after(expires_in);
    timer.async_wait(std::move(handler));
}

} // namespace shoal

#endif // SHOAL_TIME_HEADER
