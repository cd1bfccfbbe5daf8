#include "piece_storage.hpp"
#include "string_utils.hpp"
#include "settings.hpp"
#include "system.hpp"
#include "log.hpp"

#include <algorithm>
#include <cstring> // memcpy
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace shoal {

// -------------------------
// -- memory piece storage --
// -------------------------

memory_piece_storage::memory_piece_storage(
        const file_metadata& metadata, piece_buffer_pool& pool)
    : metadata_(metadata), pool_(pool), pieces_(metadata.num_pieces, nullptr)
{}

memory_piece_storage::~memory_piece_storage()
{
    free_pieces();
}

void memory_piece_storage::store(
        const piece_index_t index, const_view<uint8_t> data, error_code& error)
{
    error.clear();
    if(index < 0 || index >= int(pieces_.size())
            || int(data.size()) != metadata_.piece_length(index)) {
        error = make_error_code(std::errc::invalid_argument);
        return;
    }
    auto& piece = pieces_[index];
    if(piece == nullptr) {
        piece = static_cast<uint8_t*>(pool_.malloc());
        if(piece == nullptr) {
            error = make_error_code(std::errc::not_enough_memory);
            return;
        }
    }
    std::memcpy(piece, data.data(), data.size());
}

std::shared_ptr<const byte_source> memory_piece_storage::assemble(error_code& error)
{
    error.clear();
    std::vector<uint8_t> file(metadata_.file_size);
    for(piece_index_t i = 0; i < int(pieces_.size()); ++i) {
        if(pieces_[i] == nullptr) {
            error = make_error_code(std::errc::invalid_argument);
            return nullptr;
        }
        std::memcpy(&file[metadata_.piece_offset(i)], pieces_[i],
                metadata_.piece_length(i));
    }
    free_pieces();
    return make_memory_source(std::move(file));
}

void memory_piece_storage::free_pieces() noexcept
{
    for(auto& piece : pieces_) {
        if(piece) {
            pool_.free(piece);
            piece = nullptr;
        }
    }
}

// -----------------------
// -- file piece storage --
// -----------------------

file_piece_storage::file_piece_storage(const file_metadata& metadata, path path)
    : metadata_(metadata), path_(std::move(path))
{}

file_piece_storage::~file_piece_storage()
{
    if(file_handle_ != -1) {
        close();
        error_code ec;
        fs::remove(path_, ec);
    }
}

void file_piece_storage::open(error_code& error)
{
    error.clear();
    file_handle_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_TRUNC, 0644);
    if(file_handle_ == -1) {
        error = system::last_error();
        return;
    }
    if(::ftruncate(file_handle_, metadata_.file_size) != 0) {
        error = system::last_error();
        close();
        error_code ec;
        fs::remove(path_, ec);
    }
}

void file_piece_storage::store(
        const piece_index_t index, const_view<uint8_t> data, error_code& error)
{
    error.clear();
    if(file_handle_ == -1 || index < 0 || index >= metadata_.num_pieces
            || int(data.size()) != metadata_.piece_length(index)) {
        error = make_error_code(std::errc::invalid_argument);
        return;
    }
    // pwrite is not guaranteed to write everything in one go
    const uint8_t* buffer = data.data();
    size_t num_left = data.size();
    off_t offset = metadata_.piece_offset(index);
    while(num_left > 0) {
        const ssize_t n = ::pwrite(file_handle_, buffer, num_left, offset);
        if(n < 0) {
            if(errno == EINTR) {
                continue;
            }
            error = system::last_error();
            return;
        }
        buffer += n;
        num_left -= n;
        offset += n;
    }
}

std::shared_ptr<const byte_source> file_piece_storage::assemble(error_code& error)
{
    error.clear();
    if(file_handle_ == -1) {
        error = make_error_code(std::errc::bad_file_descriptor);
        return nullptr;
    }
    close();
    auto source = map_file(path_, error);
    // the mapping keeps the contents alive, the directory entry is not needed
    error_code ec;
    fs::remove(path_, ec);
    if(ec) {
#ifdef SHOAL_ENABLE_LOGGING
        log::log_storage("SPILL",
                util::format("couldn't unlink %s: %s", path_.c_str(),
                        ec.message().c_str()),
                false, log::priority::high);
#endif // SHOAL_ENABLE_LOGGING
    }
    return source;
}

void file_piece_storage::close() noexcept
{
    if(file_handle_ != -1) {
        ::close(file_handle_);
        file_handle_ = -1;
    }
}

std::unique_ptr<piece_storage> create_piece_storage(const file_metadata& metadata,
        const transfer_settings& settings, piece_buffer_pool& pool, error_code& error)
{
    error.clear();
    if(!settings.spill_path.empty()
            && metadata.file_size > settings.in_memory_threshold) {
        fs::create_directories(settings.spill_path, error);
        if(error) {
            return nullptr;
        }
        auto storage = std::make_unique<file_piece_storage>(
                metadata, settings.spill_path / (metadata.file_id + ".part"));
        storage->open(error);
        if(error) {
            return nullptr;
        }
        return storage;
    }
    return std::make_unique<memory_piece_storage>(metadata, pool);
}

} // namespace shoal
