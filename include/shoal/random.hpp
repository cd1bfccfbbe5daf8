#ifndef SHOAL_RANDOM_HEADER
#define SHOAL_RANDOM_HEADER

#include <random>
#include <string>

namespace shoal {
namespace util {

std::mt19937& random_engine();

/** Returns a random integer in the range [0, max] or [min, max]. */
int random_int(const int max);
int random_int(const int min, const int max);

/**
 * Returns a random RFC 4122 version 4 UUID in its canonical, lowercase textual form,
 * e.g. "3f2b8c1e-9d4a-4c7b-8e21-5a6f0b9c2d13".
 */
std::string random_uuid();

} // namespace util
} // namespace shoal

#endif // SHOAL_RANDOM_HEADER
