#ifndef SHOAL_EXPONENTIAL_BACKOFF_HEADER
#define SHOAL_EXPONENTIAL_BACKOFF_HEADER

#include <algorithm>

namespace shoal {

/**
 * A binary exponential backoff generator: each call returns the current delay and
 * doubles it for the next call, capped at `max`.
 */
template <typename Duration>
class exponential_backoff
{
    Duration base_;
    Duration value_;
    Duration max_;

public:
    exponential_backoff(Duration base, Duration max)
        : base_(base), value_(base), max_(std::max(base, max))
    {}

    void reset() noexcept { value_ = base_; }

    Duration operator()() noexcept
    {
        const auto tmp = value_;
        value_ = value_ > max_ / 2 ? max_ : std::min(value_ * 2, max_);
        return tmp;
    }
};

} // namespace shoal

#endif // SHOAL_EXPONENTIAL_BACKOFF_HEADER
