#ifndef SHOAL_PIECE_STORAGE_HEADER
#define SHOAL_PIECE_STORAGE_HEADER

#include "file_metadata.hpp"
#include "byte_source.hpp"
#include "error_code.hpp"
#include "path.hpp"
#include "view.hpp"

#include <memory>
#include <vector>

#include <boost/pool/pool.hpp>

namespace shoal {

struct transfer_settings;

// Pieces of in-memory downloads are allocated from here. Every chunk is exactly one
// piece long.
//
// NOTE: the pool must outlive every storage that allocated from it, and is not
// thread-safe; it is only used on the network thread.
using piece_buffer_pool = boost::pool<>;

/** Where a transfer keeps its verified pieces until it is complete. */
class piece_storage
{
public:
    virtual ~piece_storage() = default;

    /** `data` must already have been verified against the piece's hash. */
    virtual void store(const piece_index_t index, const_view<uint8_t> data,
            error_code& error) = 0;

    /**
     * Once all pieces have been stored, returns the whole file as one byte source.
     * The storage must not be used after this.
     */
    virtual std::shared_ptr<const byte_source> assemble(error_code& error) = 0;
};

/** Keeps pieces in pool allocated buffers and copies them into one on assembly. */
class memory_piece_storage final : public piece_storage
{
    const file_metadata metadata_;
    piece_buffer_pool& pool_;
    // Not yet stored pieces are nullptr.
    std::vector<uint8_t*> pieces_;

public:
    memory_piece_storage(const file_metadata& metadata, piece_buffer_pool& pool);
    ~memory_piece_storage() override;

    void store(const piece_index_t index, const_view<uint8_t> data,
            error_code& error) override;
    std::shared_ptr<const byte_source> assemble(error_code& error) override;

private:
    void free_pieces() noexcept;
};

/**
 * Writes pieces at their final offset into a file of the full size, so that the
 * complete file need never be held in memory. On assembly the file is memory mapped
 * and unlinked; if the transfer is abandoned, the file is removed.
 */
class file_piece_storage final : public piece_storage
{
    const file_metadata metadata_;
    path path_;
    int file_handle_ = -1;

public:
    file_piece_storage(const file_metadata& metadata, path path);
    ~file_piece_storage() override;

    /** Creates and preallocates the file. Must be called before anything else. */
    void open(error_code& error);

    void store(const piece_index_t index, const_view<uint8_t> data,
            error_code& error) override;
    std::shared_ptr<const byte_source> assemble(error_code& error) override;

    const path& file_path() const noexcept { return path_; }

private:
    void close() noexcept;
};

/**
 * Picks the storage for a new transfer: files above the in-memory threshold are
 * spilled to disk when a spill path is configured.
 */
std::unique_ptr<piece_storage> create_piece_storage(const file_metadata& metadata,
        const transfer_settings& settings, piece_buffer_pool& pool, error_code& error);

} // namespace shoal

#endif // SHOAL_PIECE_STORAGE_HEADER
