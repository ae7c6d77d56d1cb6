#pragma once

#include <array>
#include <string_view>
#include <sodium.h>

namespace folio::crypto::hash {

using Digest = std::array<unsigned char, crypto_generichash_BYTES>;

Digest blake2b(std::string_view data);

// Fixed-time equality. Both sides are reduced to fixed-size digests first, so inputs of
// unequal length take the same comparison path as equal-length ones.
bool constantTimeEquals(std::string_view a, std::string_view b);

}
