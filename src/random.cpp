#include "random.hpp"
#include "string_utils.hpp"

#include <array>
#include <mutex>

namespace shoal {
namespace util {

// Uploads hash on the thread pool, which generates file ids there, so the engine is
// shared between threads.
static std::mutex g_engine_mutex;

std::mt19937& random_engine()
{
    static std::random_device dev;
    static std::mt19937 rng(dev());
    return rng;
}

int random_int(const int max)
{
    return random_int(0, max);
}

int random_int(const int min, const int max)
{
    std::lock_guard<std::mutex> l(g_engine_mutex);
    return std::uniform_int_distribution<int>(min, max)(random_engine());
}

std::string random_uuid()
{
    std::array<uint8_t, 16> bytes;
    {
        std::lock_guard<std::mutex> l(g_engine_mutex);
        std::uniform_int_distribution<int> dist(0, 255);
        for(auto& b : bytes) {
            b = static_cast<uint8_t>(dist(random_engine()));
        }
    }
    // version 4, variant 10xx
    bytes[6] = (bytes[6] & 0x0f) | 0x40;
    bytes[8] = (bytes[8] & 0x3f) | 0x80;

    const std::string hex = to_hex(bytes);
    return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-'
            + hex.substr(16, 4) + '-' + hex.substr(20);
}

} // namespace util
} // namespace shoal
