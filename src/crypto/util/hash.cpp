#include "crypto/util/hash.hpp"

#include <sodium.h>
#include <stdexcept>

namespace folio::crypto::hash {

Digest blake2b(const std::string_view data) {
    Digest hash{};
    if (crypto_generichash(hash.data(), hash.size(),
                           reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                           nullptr, 0) != 0)
        throw std::runtime_error("BLAKE2b hashing failed");
    return hash;
}

bool constantTimeEquals(const std::string_view a, const std::string_view b) {
    const auto ha = blake2b(a);
    const auto hb = blake2b(b);
    return sodium_memcmp(ha.data(), hb.data(), ha.size()) == 0;
}

}
