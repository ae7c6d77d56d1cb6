#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace folio::crypto::util {

// Standard alphabet with padding.
std::string b64_encode(const std::vector<uint8_t>& data);

std::vector<uint8_t> b64_decode(const std::string& b64);

}
