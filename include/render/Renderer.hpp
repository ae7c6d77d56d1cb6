#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace folio::render {

struct RenderError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// HTML/CSS-to-PDF engine. Implementations must be callable from several threads at once.
class Renderer {
public:
    virtual ~Renderer() = default;

    // Renders a complete HTML string to PDF bytes. Throws RenderError on failure.
    virtual std::vector<uint8_t> render(const std::string& html) = 0;
};

}
