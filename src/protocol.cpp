#include "protocol.hpp"
#include "protocol_error.hpp"
#include "payload.hpp"

namespace shoal {
namespace protocol {

inline payload make_header(const message_type type, const int size_hint)
{
    payload p(2 + size_hint);
    p.u8(version).u8(static_cast<uint8_t>(type));
    return p;
}

std::vector<uint8_t> encode_source_request(const file_id_t& file_id)
{
    auto p = make_header(message_type::source_request, 2 + file_id.size());
    p.string(file_id);
    return std::move(p.data);
}

std::vector<uint8_t> encode_source_announce(
        const file_id_t& file_id, const peer_id_t& sender_id)
{
    auto p = make_header(
            message_type::source_announce, 4 + file_id.size() + sender_id.size());
    p.string(file_id).string(sender_id);
    return std::move(p.data);
}

std::vector<uint8_t> encode_piece_request(const file_id_t& file_id,
        const piece_index_t index, const peer_id_t& target_seeder_id)
{
    auto p = make_header(message_type::piece_request,
            8 + file_id.size() + target_seeder_id.size());
    p.string(file_id).i32(index).string(target_seeder_id);
    return std::move(p.data);
}

std::vector<uint8_t> encode_file_piece(const file_id_t& file_id,
        const piece_index_t index, const peer_id_t& sender_id, const_view<uint8_t> data)
{
    auto p = make_header(message_type::file_piece,
            12 + file_id.size() + sender_id.size() + data.size());
    p.string(file_id).i32(index).string(sender_id).blob(data);
    return std::move(p.data);
}

message decode(const_view<uint8_t> buffer, error_code& error)
{
    error.clear();
    payload_reader reader(buffer);
    const auto v = reader.u8();
    const auto type = reader.u8();
    if(!reader.ok()) {
        error = make_error_code(protocol_errc::truncated_message);
        return {};
    }
    if(v != version) {
        error = make_error_code(protocol_errc::unsupported_version);
        return {};
    }

    message msg;
    msg.type = static_cast<message_type>(type);
    switch(msg.type) {
    case message_type::source_request:
        msg.file_id = reader.string();
        break;
    case message_type::source_announce:
        msg.file_id = reader.string();
        msg.peer_id = reader.string();
        break;
    case message_type::piece_request:
        msg.file_id = reader.string();
        msg.piece_index = reader.i32();
        msg.peer_id = reader.string();
        break;
    case message_type::file_piece:
        msg.file_id = reader.string();
        msg.piece_index = reader.i32();
        msg.peer_id = reader.string();
        msg.data = reader.blob();
        break;
    default:
        error = make_error_code(protocol_errc::unknown_message_type);
        return {};
    }

    if(!reader.ok()) {
        error = make_error_code(protocol_errc::truncated_message);
    } else if(reader.remaining() > 0) {
        error = make_error_code(protocol_errc::trailing_bytes);
    } else if(msg.file_id.empty()
            || ((msg.type == message_type::piece_request
                        || msg.type == message_type::file_piece)
                    && msg.piece_index < 0)
            || (msg.type != message_type::source_request && msg.peer_id.empty())) {
        error = make_error_code(protocol_errc::invalid_field);
    }
    return msg;
}

const char* message_type_name(const message_type type) noexcept
{
    switch(type) {
    case message_type::source_request: return "source_request";
    case message_type::source_announce: return "source_announce";
    case message_type::piece_request: return "piece_request";
    case message_type::file_piece: return "file_piece";
    default: return "unknown";
    }
}

} // namespace protocol
} // namespace shoal
