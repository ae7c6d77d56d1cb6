#pragma once

#include "render/Renderer.hpp"
#include "config/Config.hpp"

namespace folio::render {

// Renders XHTML with Wt's WPdfRenderer into an in-memory libharu document.
// Each call owns its own HPDF_Doc, so concurrent calls share nothing.
class WtPdfRenderer final : public Renderer {
public:
    explicit WtPdfRenderer(const config::RenderConfig& cfg);

    std::vector<uint8_t> render(const std::string& html) override;

private:
    config::RenderConfig cfg_;
};

}
