#ifndef SHOAL_TRANSPORT_HEADER
#define SHOAL_TRANSPORT_HEADER

#include "types.hpp"

#include <cstdint>
#include <vector>

namespace shoal {

/**
 * The pub/sub network the engine talks over. It is implemented by the embedding
 * application, and is expected to deliver every broadcast message at least once to
 * every subscriber of the channel (possibly including the sender), in no particular
 * order across peers. Inbound messages are passed to `engine::handle_message`.
 */
class transport
{
public:
    virtual ~transport() = default;

    /**
     * Sends `payload` to every member of `channel`. If `key` is not empty, the
     * transport encrypts the payload with it. Must not block and must not call back
     * into the engine synchronously.
     */
    virtual void broadcast(const channel_ref& channel, std::vector<uint8_t> payload,
            const channel_key& key) = 0;
};

/** What the engine needs to know about the local identity and channels. */
class channel_directory
{
public:
    virtual ~channel_directory() = default;

    virtual peer_id_t local_peer_id() const = 0;
    virtual channel_privacy privacy(const channel_ref& channel) const = 0;
    /** The key to encrypt our responses on `channel` with, empty if none. */
    virtual channel_key key_for(const channel_ref& channel) const = 0;
};

} // namespace shoal

#endif // SHOAL_TRANSPORT_HEADER
