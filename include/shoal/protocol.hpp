#ifndef SHOAL_PROTOCOL_HEADER
#define SHOAL_PROTOCOL_HEADER

#include "error_code.hpp"
#include "types.hpp"
#include "view.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace shoal {

/**
 * Messages exchanged over the broadcast transport. Every message begins with
 * a version byte and a type byte, followed by the type's fields in Network Byte
 * Order. Strings are prefixed with a 16 bit length, piece data with a 32 bit one.
 *
 * source_request:  <file_id>
 * source_announce: <file_id><sender_id>
 * piece_request:   <file_id><i32 piece_index><target_seeder_id>
 * file_piece:      <file_id><i32 piece_index><sender_id><data>
 */
namespace protocol {

constexpr uint8_t version = 1;

enum class message_type : uint8_t
{
    source_request = 1,
    source_announce = 2,
    piece_request = 3,
    file_piece = 4
};

struct message
{
    message_type type;
    file_id_t file_id;
    piece_index_t piece_index = invalid_piece_index;
    // The announcing seeder for source_announce and file_piece messages, the
    // addressee for piece_request messages.
    peer_id_t peer_id;
    // Only file_piece messages carry data. It points into the decoded buffer.
    const_view<uint8_t> data;
};

std::vector<uint8_t> encode_source_request(const file_id_t& file_id);
std::vector<uint8_t> encode_source_announce(
        const file_id_t& file_id, const peer_id_t& sender_id);
std::vector<uint8_t> encode_piece_request(const file_id_t& file_id,
        const piece_index_t index, const peer_id_t& target_seeder_id);
std::vector<uint8_t> encode_file_piece(const file_id_t& file_id,
        const piece_index_t index, const peer_id_t& sender_id,
        const_view<uint8_t> data);

/**
 * Decodes a message. On failure `error` is set to a `protocol_errc` and the returned
 * message must not be used. The returned message's data refers to `buffer`.
 */
message decode(const_view<uint8_t> buffer, error_code& error);

const char* message_type_name(const message_type type) noexcept;

} // namespace protocol
} // namespace shoal

#endif // SHOAL_PROTOCOL_HEADER
