#ifndef SHOAL_PIECE_HASHER_HEADER
#define SHOAL_PIECE_HASHER_HEADER

#include "file_metadata.hpp"
#include "byte_source.hpp"
#include "error_code.hpp"

#include <functional>
#include <memory>
#include <string>

#include <asio/io_context.hpp>

namespace shoal {

class thread_pool;

/**
 * Splits `source` into `piece_size` long pieces (the last one may be shorter) and
 * hashes each with SHA-256, in piece order. The file is given a new random id.
 *
 * Empty files, files larger than `max_file_size` and hashing failures are reported
 * through `error` as a `transfer_errc`, in which case no metadata is returned.
 *
 * This may block for a long time on large files and is safe to call from any thread.
 */
file_metadata hash_file(const byte_source& source, std::string file_name,
        std::string mime_type, const int piece_size, const int64_t max_file_size,
        error_code& error);

/**
 * Runs `hash_file` on the thread pool and delivers the result on the network thread,
 * so that uploading a large file does not stall transfers.
 */
class piece_hasher
{
public:
    using handler_type = std::function<void(const error_code&, file_metadata)>;

private:
    asio::io_context& network_ios_;
    thread_pool& thread_pool_;

public:
    piece_hasher(asio::io_context& network_ios, thread_pool& thread_pool);

    /**
     * `handler` is invoked on `network_ios` once hashing finished or failed. The
     * source is kept alive until then.
     */
    void async_hash(std::shared_ptr<const byte_source> source, std::string file_name,
            std::string mime_type, const int piece_size, const int64_t max_file_size,
            handler_type handler);
};

} // namespace shoal

#endif // SHOAL_PIECE_HASHER_HEADER
