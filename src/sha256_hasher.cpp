#include "sha256_hasher.hpp"

namespace shoal {

sha256_hasher::sha256_hasher()
{
    reset();
}

void sha256_hasher::reset()
{
    failed_ = SHA256_Init(&context_) != 1;
}

sha256_hasher& sha256_hasher::update(const_view<uint8_t> buffer)
{
    if(SHA256_Update(&context_, buffer.data(), buffer.size()) != 1) {
        failed_ = true;
    }
    return *this;
}

sha256_hash sha256_hasher::finish()
{
    sha256_hash digest;
    if(SHA256_Final(digest.data(), &context_) != 1) {
        failed_ = true;
    }
    return digest;
}

} // namespace shoal
