#ifndef SHOAL_FILE_METADATA_HEADER
#define SHOAL_FILE_METADATA_HEADER

#include "error_code.hpp"
#include "types.hpp"
#include "view.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace shoal {

/**
 * Describes a distributed file. It is created exactly once, by the uploader's piece
 * hasher, and never changes afterwards. Downloaders receive it out of band, on the
 * caller's own announcement message.
 */
struct file_metadata
{
    file_id_t file_id;
    std::string file_name;
    int64_t file_size = 0;
    std::string mime_type;
    int piece_size = 0;
    int num_pieces = 0;
    // One digest per piece, in piece order.
    std::vector<sha256_hash> piece_hashes;

    /** The first byte of piece `index` within the file. */
    int64_t piece_offset(const piece_index_t index) const noexcept
    {
        return int64_t(index) * piece_size;
    }

    /** Every piece is `piece_size` long save for the last, which may be shorter. */
    int piece_length(const piece_index_t index) const noexcept
    {
        return static_cast<int>(
                std::min<int64_t>(piece_size, file_size - piece_offset(index)));
    }
};

bool operator==(const file_metadata& a, const file_metadata& b) noexcept;

inline int num_pieces_for(const int64_t file_size, const int piece_size) noexcept
{
    return static_cast<int>((file_size + piece_size - 1) / piece_size);
}

/**
 * File ids are used to name files on disk, so only ASCII alphanumerics, '-' and '_'
 * are accepted, and at most 64 of them.
 */
bool is_valid_file_id(const file_id_t& file_id) noexcept;

/**
 * Checks that metadata received from the network is internally consistent and uses
 * `expected_piece_size`. Reports `transfer_errc::invalid_metadata` otherwise, or
 * `transfer_errc::file_too_large` if the file is larger than `max_file_size`.
 */
void verify_metadata(const file_metadata& metadata, const int expected_piece_size,
        const int64_t max_file_size, error_code& error);

/** Binary encoding for callers to carry metadata on their own messages. */
std::vector<uint8_t> encode_metadata(const file_metadata& metadata);
file_metadata decode_metadata(const_view<uint8_t> buffer, error_code& error);

} // namespace shoal

#endif // SHOAL_FILE_METADATA_HEADER
