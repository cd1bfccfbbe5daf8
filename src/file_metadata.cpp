#include "file_metadata.hpp"
#include "protocol_error.hpp"
#include "transfer_error.hpp"
#include "payload.hpp"

#include <cctype>
#include <limits>

namespace shoal {

// Bumped whenever the layout below changes.
constexpr uint8_t metadata_version = 1;

bool operator==(const file_metadata& a, const file_metadata& b) noexcept
{
    return a.file_id == b.file_id && a.file_name == b.file_name
            && a.file_size == b.file_size && a.mime_type == b.mime_type
            && a.piece_size == b.piece_size && a.num_pieces == b.num_pieces
            && a.piece_hashes == b.piece_hashes;
}

bool is_valid_file_id(const file_id_t& file_id) noexcept
{
    if(file_id.empty() || file_id.size() > 64) {
        return false;
    }
    return std::all_of(file_id.begin(), file_id.end(), [](const unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

void verify_metadata(const file_metadata& metadata, const int expected_piece_size,
        const int64_t max_file_size, error_code& error)
{
    error.clear();
    if(metadata.file_size > max_file_size) {
        error = make_error_code(transfer_errc::file_too_large);
        return;
    }
    // the piece count must fit in a piece index
    const int64_t max_pieces = std::numeric_limits<piece_index_t>::max();
    if(expected_piece_size <= 0 || !is_valid_file_id(metadata.file_id)
            || metadata.file_size <= 0
            || metadata.file_size > max_pieces * expected_piece_size
            || metadata.piece_size != expected_piece_size
            || metadata.num_pieces
                    != num_pieces_for(metadata.file_size, metadata.piece_size)
            || int(metadata.piece_hashes.size()) != metadata.num_pieces) {
        error = make_error_code(transfer_errc::invalid_metadata);
    }
}

std::vector<uint8_t> encode_metadata(const file_metadata& metadata)
{
    payload p(64 + metadata.file_name.size() + 32 * metadata.piece_hashes.size());
    p.u8(metadata_version)
            .string(metadata.file_id)
            .string(metadata.file_name)
            .i64(metadata.file_size)
            .string(metadata.mime_type)
            .i32(metadata.piece_size)
            .i32(metadata.num_pieces);
    for(const auto& hash : metadata.piece_hashes) {
        p.buffer(hash);
    }
    return std::move(p.data);
}

file_metadata decode_metadata(const_view<uint8_t> buffer, error_code& error)
{
    error.clear();
    payload_reader reader(buffer);
    if(reader.u8() != metadata_version) {
        error = reader.ok() ? make_error_code(protocol_errc::unsupported_version)
                            : make_error_code(protocol_errc::truncated_message);
        return {};
    }

    file_metadata metadata;
    metadata.file_id = reader.string();
    metadata.file_name = reader.string();
    metadata.file_size = reader.i64();
    metadata.mime_type = reader.string();
    metadata.piece_size = reader.i32();
    metadata.num_pieces = reader.i32();
    if(!reader.ok()) {
        error = make_error_code(protocol_errc::truncated_message);
        return {};
    }
    // the hash list is the last field, so its length must match exactly what's left
    if(metadata.num_pieces < 0
            || reader.remaining() != size_t(metadata.num_pieces) * sizeof(sha256_hash)) {
        error = make_error_code(protocol_errc::invalid_field);
        return {};
    }
    metadata.piece_hashes.resize(metadata.num_pieces);
    for(auto& hash : metadata.piece_hashes) {
        const auto bytes = reader.bytes(hash.size());
        std::copy(bytes.begin(), bytes.end(), hash.begin());
    }
    return metadata;
}

} // namespace shoal
