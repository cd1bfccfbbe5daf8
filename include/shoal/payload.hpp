#ifndef SHOAL_PAYLOAD_HEADER
#define SHOAL_PAYLOAD_HEADER

#include "endian.hpp"
#include "view.hpp"

#include <iterator>
#include <string>
#include <vector>

namespace shoal {

/**
 * Used to build an outgoing raw message with builder semantics, writing multi-byte
 * integers in Network Byte Order.
 */
struct payload
{
    std::vector<uint8_t> data;

    payload() = default;

    explicit payload(const int size) { data.reserve(size); }

    payload& u8(const uint8_t h)
    {
        data.emplace_back(h);
        return *this;
    }

    payload& u16(const uint16_t h)
    {
        add_integer<uint16_t>(h);
        return *this;
    }

    payload& i32(const int32_t h)
    {
        add_integer<int32_t>(h);
        return *this;
    }

    payload& u32(const uint32_t h)
    {
        add_integer<uint32_t>(h);
        return *this;
    }

    payload& i64(const int64_t h)
    {
        add_integer<int64_t>(h);
        return *this;
    }

    template <typename InputIt>
    payload& range(InputIt begin, InputIt end)
    {
        data.insert(data.cend(), begin, end);
        return *this;
    }

    template <typename Buffer>
    payload& buffer(const Buffer& buffer)
    {
        return range(std::begin(buffer), std::end(buffer));
    }

    /** Strings are prefixed with their 16 bit length. */
    payload& string(const std::string& s)
    {
        u16(static_cast<uint16_t>(s.size()));
        return range(s.begin(), s.end());
    }

    /** Binary blobs are prefixed with their 32 bit length. */
    payload& blob(const_view<uint8_t> b)
    {
        u32(static_cast<uint32_t>(b.size()));
        return range(b.begin(), b.end());
    }

private:
    template <typename Int>
    void add_integer(Int x)
    {
        const auto pos = data.size();
        data.resize(data.size() + sizeof(Int));
        endian::write_network<Int>(&data[pos], x);
    }
};

/**
 * The reading counterpart of `payload`. Reads past the end of the buffer do not
 * throw: they mark the reader as failed and return empty values, so a decoder may
 * read every field first and check `ok()` once.
 */
class payload_reader
{
    const_view<uint8_t> buffer_;
    bool ok_ = true;

public:
    explicit payload_reader(const_view<uint8_t> buffer) : buffer_(buffer) {}

    bool ok() const noexcept { return ok_; }
    size_t remaining() const noexcept { return buffer_.size(); }

    uint8_t u8() { return read_integer<uint8_t>(); }
    uint16_t u16() { return read_integer<uint16_t>(); }
    int32_t i32() { return read_integer<int32_t>(); }
    uint32_t u32() { return read_integer<uint32_t>(); }
    int64_t i64() { return read_integer<int64_t>(); }

    const_view<uint8_t> bytes(const size_t n)
    {
        if(!ok_ || n > buffer_.size()) {
            ok_ = false;
            return {};
        }
        const auto b = buffer_.subview(0, n);
        buffer_.trim_front(n);
        return b;
    }

    std::string string()
    {
        const auto b = bytes(u16());
        return std::string(b.begin(), b.end());
    }

    const_view<uint8_t> blob() { return bytes(u32()); }

private:
    template <typename Int>
    Int read_integer()
    {
        const auto b = bytes(sizeof(Int));
        if(b.empty()) {
            return 0;
        }
        return endian::read_network<Int>(b.data());
    }
};

} // namespace shoal

#endif // SHOAL_PAYLOAD_HEADER
