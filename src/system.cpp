#include "system.hpp"

#include <cerrno>

namespace shoal {
namespace system {

error_code last_error() noexcept
{
    error_code error;
    error.assign(errno, system_category());
    return error;
}

} // namespace system
} // namespace shoal
