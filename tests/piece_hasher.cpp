#include "piece_hasher.hpp"
#include "sha256_hasher.hpp"
#include "transfer_error.hpp"
#include "thread_pool.hpp"
#include "test_util.hpp"

#include <cassert>
#include <set>

using namespace shoal;
using namespace shoal_test;

int main()
{
    const int piece_size = 128 * 1024;
    const int64_t max_file_size = 500 * 1024 * 1024;

    // a 300 KB file is split into two full pieces and a 44 KB tail
    {
        const auto bytes = make_bytes(300 * 1024);
        const memory_byte_source source(bytes);
        error_code error;
        const auto md = hash_file(
                source, "clip.mp4", "video/mp4", piece_size, max_file_size, error);
        assert(!error);
        assert(md.file_name == "clip.mp4");
        assert(md.mime_type == "video/mp4");
        assert(md.file_size == 300 * 1024);
        assert(md.num_pieces == 3);
        assert(md.piece_hashes.size() == 3);
        assert(md.piece_length(0) == 128 * 1024);
        assert(md.piece_length(1) == 128 * 1024);
        assert(md.piece_length(2) == 44 * 1024);
        for(int i = 0; i < md.num_pieces; ++i) {
            const auto piece = source.slice(md.piece_offset(i), md.piece_length(i));
            assert(md.piece_hashes[i] == create_sha256_digest(piece));
        }

        error_code ec;
        verify_metadata(md, piece_size, 300 * 1024, ec);
        assert(!ec);

        // a random version 4 UUID
        assert(md.file_id.size() == 36);
        assert(md.file_id[8] == '-' && md.file_id[13] == '-');
        assert(md.file_id[14] == '4');
        assert(is_valid_file_id(md.file_id));
    }

    // the same content uploaded twice is two distinct files
    {
        const memory_byte_source source(make_bytes(1000));
        error_code error;
        const auto a = hash_file(source, "a", "", piece_size, max_file_size, error);
        const auto b = hash_file(source, "a", "", piece_size, max_file_size, error);
        assert(a.piece_hashes == b.piece_hashes);
        assert(a.file_id != b.file_id);
    }

    // no metadata for files that can't be uploaded
    {
        const memory_byte_source empty(std::vector<uint8_t>{});
        error_code error;
        auto md = hash_file(empty, "empty", "", piece_size, max_file_size, error);
        assert(error == transfer_errc::empty_file);
        assert(md.file_id.empty() && md.piece_hashes.empty());

        const memory_byte_source large(make_bytes(2000));
        md = hash_file(large, "large", "", piece_size, 1999, error);
        assert(error == transfer_errc::file_too_large);
        assert(md.file_id.empty());
    }

    // hashing in the background delivers the result on the io_context
    {
        asio::io_context ios;
        thread_pool pool(2);
        piece_hasher hasher(ios, pool);

        std::set<file_id_t> ids;
        int num_done = 0;
        error_code last_error;
        for(int i = 0; i < 4; ++i) {
            hasher.async_hash(make_memory_source(make_bytes(50 * 1024, i)), "f", "",
                    16 * 1024, max_file_size,
                    [&](const error_code& error, file_metadata md) {
                        assert(!error);
                        assert(md.num_pieces == 4);
                        ids.insert(md.file_id);
                        ++num_done;
                    });
        }
        hasher.async_hash(make_memory_source({}), "empty", "", 16 * 1024, max_file_size,
                [&](const error_code& error, file_metadata md) {
                    last_error = error;
                    assert(md.file_id.empty());
                    ++num_done;
                });

        // the pending jobs keep the io_context from running out of work
        ios.run();
        assert(num_done == 5);
        assert(ids.size() == 4);
        assert(last_error == transfer_errc::empty_file);
        pool.join();
    }
}
