#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace folio::auth {

// Validates "Authorization: Bearer <key>" against the configured API key.
//
// A request that carries no Authorization header (or an empty one) is let through;
// only a header that is present and fails validation is rejected. Callers that
// omit auth entirely rely on this, so it is kept as is.
class ApiKeyVerifier {
public:
    explicit ApiKeyVerifier(std::string apiKey);

    [[nodiscard]] bool verify(const std::optional<std::string_view>& authorization) const;

    // Returns the token when the header has exactly two whitespace-separated parts
    // and the first is "bearer" in any case.
    static std::optional<std::string_view> extractBearerToken(std::string_view header);

private:
    std::string apiKey_;
};

}
