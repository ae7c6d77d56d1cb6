#include "auth/ApiKeyVerifier.hpp"
#include "crypto/util/hash.hpp"

#include <algorithm>
#include <cctype>
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace folio::auth {

namespace {

// Header bytes are read as Latin-1: ASCII whitespace, the 0x1C-0x1F separators,
// NEL (0x85) and NBSP (0xA0) all split the header.
bool isSpace(const char c) {
    const auto u = static_cast<unsigned char>(c);
    return (u >= 0x09 && u <= 0x0D) || (u >= 0x1C && u <= 0x20) || u == 0x85 || u == 0xA0;
}

std::vector<std::string_view> splitWhitespace(std::string_view s) {
    std::vector<std::string_view> parts;
    while (!s.empty()) {
        while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
        if (s.empty()) break;
        const auto end = std::find_if(s.begin(), s.end(), isSpace);
        const auto len = static_cast<std::size_t>(end - s.begin());
        parts.push_back(s.substr(0, len));
        s.remove_prefix(len);
    }
    return parts;
}

bool iequals(const std::string_view a, const std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

}

ApiKeyVerifier::ApiKeyVerifier(std::string apiKey) : apiKey_(std::move(apiKey)) {
    if (sodium_init() < 0) throw std::runtime_error("libsodium initialization failed in ApiKeyVerifier");
}

std::optional<std::string_view> ApiKeyVerifier::extractBearerToken(const std::string_view header) {
    const auto parts = splitWhitespace(header);
    if (parts.size() != 2 || !iequals(parts[0], "bearer")) return std::nullopt;
    return parts[1];
}

bool ApiKeyVerifier::verify(const std::optional<std::string_view>& authorization) const {
    if (!authorization || authorization->empty()) return true;

    const auto token = extractBearerToken(*authorization);
    if (!token) return false;

    return crypto::hash::constantTimeEquals(*token, apiKey_);
}

}
