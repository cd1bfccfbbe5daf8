#ifndef SHOAL_SHA256_HASHER_HEADER
#define SHOAL_SHA256_HASHER_HEADER

#include "types.hpp"
#include "view.hpp"

#include <utility> // declval

#include <openssl/sha.h>

namespace shoal {

/**
 * Computes SHA-256 digests of pieces. The data need not be in memory all at once, it
 * can be fed incrementally with update() and the digest obtained with finish().
 *
 * OpenSSL reports failure of the low level calls with a 0 return value, which is
 * recorded and can be queried with failed() after finish().
 */
class sha256_hasher
{
    SHA256_CTX context_;
    bool failed_ = false;

public:
    sha256_hasher();

    void reset();

    sha256_hasher& update(const_view<uint8_t> buffer);
    template <typename Container, typename = decltype(std::declval<Container>().data())>
    sha256_hasher& update(const Container& buffer);

    sha256_hash finish();

    bool failed() const noexcept { return failed_; }
};

template <typename Container, typename>
sha256_hasher& sha256_hasher::update(const Container& buffer)
{
    return update(const_view<uint8_t>(
            reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size()));
}

/** Convenience function for when all the data is available up front. */
template <typename Buffer>
sha256_hash create_sha256_digest(const Buffer& buffer)
{
    sha256_hasher hasher;
    hasher.update(buffer);
    return hasher.finish();
}

} // namespace shoal

#endif // SHOAL_SHA256_HASHER_HEADER
