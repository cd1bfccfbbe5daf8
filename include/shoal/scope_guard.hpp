#ifndef SHOAL_SCOPE_GUARD_HEADER
#define SHOAL_SCOPE_GUARD_HEADER

#include <functional>

namespace shoal {
namespace util {

/** Runs the given function on scope exit unless disabled beforehand. */
class scope_guard
{
    std::function<void()> function_;
    bool is_active_ = true;

public:
    explicit scope_guard(std::function<void()> f) : function_(std::move(f)) {}

    scope_guard(const scope_guard&) = delete;
    scope_guard& operator=(const scope_guard&) = delete;

    ~scope_guard()
    {
        if(is_active_ && function_) {
            function_();
        }
    }

    void disable() noexcept { is_active_ = false; }
};

} // namespace util
} // namespace shoal

#endif // SHOAL_SCOPE_GUARD_HEADER
