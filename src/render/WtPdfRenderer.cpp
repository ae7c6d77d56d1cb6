#include "render/WtPdfRenderer.hpp"
#include "log/Registry.hpp"

#include <Wt/Render/WPdfRenderer.h>
#include <Wt/WString.h>
#include <hpdf.h>
#include <fmt/format.h>

#include <memory>

namespace folio::render {

namespace {

struct HaruError {
    HPDF_STATUS error = HPDF_OK;
    HPDF_STATUS detail = 0;

    explicit operator bool() const noexcept { return error != HPDF_OK; }
};

// libharu reports through this callback and keeps going; only the first error is kept.
void HPDF_STDCALL onHaruError(const HPDF_STATUS error_no, const HPDF_STATUS detail_no, void* user_data) {
    auto* state = static_cast<HaruError*>(user_data);
    if (!*state) {
        state->error = error_no;
        state->detail = detail_no;
    }
}

struct DocDeleter {
    void operator()(HPDF_Doc doc) const noexcept { HPDF_Free(doc); }
};

using DocPtr = std::unique_ptr<_HPDF_Doc_Rec, DocDeleter>;

HPDF_PageSizes toHaru(const config::PageSize size) {
    switch (size) {
        case config::PageSize::A3: return HPDF_PAGE_SIZE_A3;
        case config::PageSize::A4: return HPDF_PAGE_SIZE_A4;
        case config::PageSize::A5: return HPDF_PAGE_SIZE_A5;
        case config::PageSize::Letter: return HPDF_PAGE_SIZE_LETTER;
        case config::PageSize::Legal: return HPDF_PAGE_SIZE_LEGAL;
    }
    return HPDF_PAGE_SIZE_A4;
}

std::string describe(const std::string& stage, const HaruError& e) {
    return fmt::format("{}: libharu error 0x{:04X} (detail {})", stage, e.error, e.detail);
}

}

WtPdfRenderer::WtPdfRenderer(const config::RenderConfig& cfg) : cfg_(cfg) {}

std::vector<uint8_t> WtPdfRenderer::render(const std::string& html) {
    HaruError haru;
    const DocPtr doc(HPDF_New(onHaruError, &haru));
    if (!doc) throw RenderError("Failed to allocate PDF document");

    if (HPDF_UseUTFEncodings(doc.get()) != HPDF_OK || HPDF_SetCompressionMode(doc.get(), HPDF_COMP_ALL) != HPDF_OK)
        throw RenderError(describe("Failed to configure PDF document", haru));

    HPDF_Page page = HPDF_AddPage(doc.get());
    if (!page || haru) throw RenderError(describe("Failed to create first page", haru));

    if (HPDF_Page_SetSize(page, toHaru(cfg_.page_size), cfg_.landscape ? HPDF_PAGE_LANDSCAPE : HPDF_PAGE_PORTRAIT) != HPDF_OK)
        throw RenderError(describe("Failed to set page size", haru));

    try {
        Wt::Render::WPdfRenderer renderer(doc.get(), page);
        renderer.setMargin(cfg_.margin_cm);
        renderer.setDpi(static_cast<int>(cfg_.dpi));
        renderer.render(Wt::WString::fromUTF8(html));
    } catch (const std::exception& e) {
        throw RenderError(e.what());
    } catch (...) {
        throw RenderError("Unknown layout error");
    }

    if (haru) throw RenderError(describe("Layout failed", haru));

    if (HPDF_SaveToStream(doc.get()) != HPDF_OK) throw RenderError(describe("Failed to serialize PDF", haru));

    const HPDF_UINT32 size = HPDF_GetStreamSize(doc.get());
    std::vector<uint8_t> out(size);
    HPDF_UINT32 read = size;

    if (const auto status = HPDF_ReadFromStream(doc.get(), out.data(), &read);
        status != HPDF_OK && status != HPDF_STREAM_EOF)
        throw RenderError(describe("Failed to read PDF stream", haru));

    out.resize(read);
    log::Registry::render()->debug("[WtPdfRenderer] Serialized {} bytes", out.size());
    return out;
}

}
