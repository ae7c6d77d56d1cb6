#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace folio::protocols::http::model {

// Body failed to deserialize. errors() holds one {type, loc, msg} object per problem.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(nlohmann::json errors);

    [[nodiscard]] const nlohmann::json& errors() const noexcept { return errors_; }

private:
    nlohmann::json errors_;
};

struct PdfRequest {
    std::string htmlContent;
    std::optional<std::string> customCss;

    // Throws ValidationError when the body is not JSON or does not match {htmlContent, customCss?}.
    // A missing or empty Content-Type is read as JSON; any type other than application/json or
    // application/*+json leaves the body undecoded and fails as a non-object.
    static PdfRequest parse(std::string_view body, std::optional<std::string_view> contentType = std::nullopt);

    static bool isJsonContentType(std::string_view contentType);
};

}
