#ifndef SHOAL_TYPES_HEADER
#define SHOAL_TYPES_HEADER

#include <cstdint>
#include <string>
#include <array>

namespace shoal {

using piece_index_t = int32_t;

static constexpr piece_index_t invalid_piece_index = -1;

// Every distributed file is identified by a random UUID generated at upload time.
using file_id_t = std::string;

// Peer identities are opaque strings handed to us by the identity layer. They are
// compared case-insensitively.
using peer_id_t = std::string;

// A logical broadcast channel on the external pub/sub transport, and the optional
// key with which payloads on it are encrypted (empty if none).
using channel_ref = std::string;
using channel_key = std::string;

using sha256_hash = std::array<uint8_t, 32>;

enum class channel_privacy
{
    open,
    // Password protected or otherwise private channels.
    restricted
};

} // namespace shoal

#endif // SHOAL_TYPES_HEADER
