#include "byte_source.hpp"

#include <algorithm>

namespace shoal {

const_view<uint8_t> byte_source::slice(
        const int64_t offset, const int64_t length) const noexcept
{
    if(offset < 0 || length <= 0 || offset >= size()) {
        return {};
    }
    const int64_t n = std::min(length, size() - offset);
    return {data() + offset, size_t(n)};
}

std::shared_ptr<const byte_source> map_file(const path& path, error_code& error)
{
    error.clear();
    mmap_source mmap;
    mmap.map(path.string(), error);
    if(error) {
        return nullptr;
    }
    return std::make_shared<mapped_byte_source>(std::move(mmap));
}

} // namespace shoal
