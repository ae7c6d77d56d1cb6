#pragma once

#include <optional>
#include <string>

namespace folio::render {

// Embeds custom CSS into an HTML string by plain substring search, no parsing.
// First match wins: before the first "</head>", else a new <head> before the first
// "<body>", else the whole input is wrapped in a synthesized document.
struct StyleInjector {
    static std::string inject(const std::string& html, const std::optional<std::string>& css);

    static std::string styleTag(const std::string& css) { return "<style>" + css + "</style>"; }
};

}
