#ifndef SHOAL_MMAP_HEADER
#define SHOAL_MMAP_HEADER

#include <mio/mmap.hpp>

namespace shoal {

using mmap_source = mio::basic_mmap_source<uint8_t>;

} // namespace shoal

#endif // SHOAL_MMAP_HEADER
