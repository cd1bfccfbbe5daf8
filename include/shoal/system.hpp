#ifndef SHOAL_SYSTEM_HEADER
#define SHOAL_SYSTEM_HEADER

#include "error_code.hpp"

namespace shoal {
namespace system {

/** Returns the last OS error (errno) as an error_code in the system category. */
error_code last_error() noexcept;

} // namespace system
} // namespace shoal

#endif // SHOAL_SYSTEM_HEADER
