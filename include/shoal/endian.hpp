#ifndef SHOAL_ENDIAN_HEADER
#define SHOAL_ENDIAN_HEADER

#include <endian/endian.hpp>
#include <cstdint>

namespace shoal {
namespace endian {

/**
 * Reconstructs an integer of type T from the byte sequence at `it`, converting from
 * Network Byte Order. The sequence must hold at least sizeof(T) bytes.
 */
template <typename T, typename InputIt>
T read_network(InputIt it)
{
    return ::endian::read<::endian::order::network, T>(it);
}

/** Writes `h` in Network Byte Order to a sequence with room for sizeof(T) bytes. */
template <typename T, typename OutputIt>
void write_network(OutputIt it, const T& h)
{
    ::endian::write<::endian::order::network>(h, it);
}

} // namespace endian
} // namespace shoal

#endif // SHOAL_ENDIAN_HEADER
