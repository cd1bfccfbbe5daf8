#ifndef SHOAL_BYTE_SOURCE_HEADER
#define SHOAL_BYTE_SOURCE_HEADER

#include "error_code.hpp"
#include "mmap.hpp"
#include "path.hpp"
#include "view.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace shoal {

/**
 * Read-only, contiguous contents of a whole file. Uploads, completed downloads and
 * files reloaded from the seed store are all served from a byte_source.
 *
 * Sources are shared through `std::shared_ptr<const byte_source>`, which doubles as
 * the access handle handed out to users: the memory stays valid for as long as they
 * hold on to it, even if the engine has since dropped the file.
 */
class byte_source
{
public:
    virtual ~byte_source() = default;

    virtual const uint8_t* data() const noexcept = 0;
    virtual int64_t size() const noexcept = 0;

    /**
     * Returns the bytes in [offset, offset + length), clamped to the end of the
     * source. An offset past the end yields an empty view.
     */
    const_view<uint8_t> slice(const int64_t offset, const int64_t length) const noexcept;

    const_view<uint8_t> bytes() const noexcept { return {data(), size_t(size())}; }
};

class memory_byte_source final : public byte_source
{
    std::vector<uint8_t> bytes_;

public:
    explicit memory_byte_source(std::vector<uint8_t> bytes) : bytes_(std::move(bytes))
    {}

    const uint8_t* data() const noexcept override { return bytes_.data(); }
    int64_t size() const noexcept override { return bytes_.size(); }
};

/** A read-only memory mapping of an entire file on disk. */
class mapped_byte_source final : public byte_source
{
    mmap_source mmap_;

public:
    explicit mapped_byte_source(mmap_source mmap) : mmap_(std::move(mmap)) {}

    const uint8_t* data() const noexcept override { return mmap_.data(); }
    int64_t size() const noexcept override { return mmap_.size(); }
};

inline std::shared_ptr<const byte_source> make_memory_source(std::vector<uint8_t> bytes)
{
    return std::make_shared<memory_byte_source>(std::move(bytes));
}

/**
 * Maps the file at `path`. Once mapped, the file may be unlinked and the mapping
 * remains valid for as long as the source lives.
 */
std::shared_ptr<const byte_source> map_file(const path& path, error_code& error);

} // namespace shoal

#endif // SHOAL_BYTE_SOURCE_HEADER
