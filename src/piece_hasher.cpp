#include "piece_hasher.hpp"
#include "transfer_error.hpp"
#include "sha256_hasher.hpp"
#include "string_utils.hpp"
#include "thread_pool.hpp"
#include "random.hpp"
#include "log.hpp"

#include <asio/executor_work_guard.hpp>
#include <asio/post.hpp>

#include <new>

namespace shoal {

file_metadata hash_file(const byte_source& source, std::string file_name,
        std::string mime_type, const int piece_size, const int64_t max_file_size,
        error_code& error)
{
    error.clear();
    if(source.size() == 0) {
        error = make_error_code(transfer_errc::empty_file);
        return {};
    } else if(source.size() > max_file_size) {
        error = make_error_code(transfer_errc::file_too_large);
        return {};
    }

    file_metadata metadata;
    metadata.file_name = std::move(file_name);
    metadata.mime_type = std::move(mime_type);
    metadata.file_size = source.size();
    metadata.piece_size = piece_size;
    metadata.num_pieces = num_pieces_for(source.size(), piece_size);
    metadata.piece_hashes.reserve(metadata.num_pieces);

    sha256_hasher hasher;
    for(piece_index_t i = 0; i < metadata.num_pieces; ++i) {
        hasher.reset();
        hasher.update(source.slice(metadata.piece_offset(i), metadata.piece_length(i)));
        metadata.piece_hashes.emplace_back(hasher.finish());
        if(hasher.failed()) {
            error = make_error_code(transfer_errc::hashing_failed);
            return {};
        }
    }

    // the id is only assigned once every piece was hashed
    metadata.file_id = util::random_uuid();
    return metadata;
}

piece_hasher::piece_hasher(asio::io_context& network_ios, thread_pool& thread_pool)
    : network_ios_(network_ios), thread_pool_(thread_pool)
{}

void piece_hasher::async_hash(std::shared_ptr<const byte_source> source,
        std::string file_name, std::string mime_type, const int piece_size,
        const int64_t max_file_size, handler_type handler)
{
    // keeps network_ios_ from running out of work while the job is in the pool
    auto work = asio::make_work_guard(network_ios_);
    thread_pool_.post([&network_ios = network_ios_, work = std::move(work),
                              source = std::move(source), file_name = std::move(file_name),
                              mime_type = std::move(mime_type), piece_size,
                              max_file_size, handler = std::move(handler)]() mutable {
        error_code error;
        file_metadata metadata;
        try {
            metadata = hash_file(*source, file_name, std::move(mime_type), piece_size,
                    max_file_size, error);
        } catch(const std::bad_alloc&) {
            error = make_error_code(transfer_errc::hashing_failed);
        }
#ifdef SHOAL_ENABLE_LOGGING
        log::log_storage("HASHER",
                util::format("hashed '%s' (%lld bytes, %d pieces): %s",
                        file_name.c_str(), static_cast<long long>(source->size()),
                        metadata.num_pieces, error ? error.message().c_str() : "ok"),
                true, error ? log::priority::high : log::priority::normal);
#endif // SHOAL_ENABLE_LOGGING
        asio::post(network_ios,
                [handler = std::move(handler), error, metadata = std::move(metadata)]()
                        mutable { handler(error, std::move(metadata)); });
        work.reset();
    });
}

} // namespace shoal
