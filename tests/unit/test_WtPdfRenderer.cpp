#include <gtest/gtest.h>
#include "render/WtPdfRenderer.hpp"
#include "config/util.hpp"
#include "protocols/http/handler/Health.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace folio;
using folio::render::WtPdfRenderer;

namespace {

std::string asText(const std::vector<uint8_t>& bytes) { return {bytes.begin(), bytes.end()}; }

}

class WtPdfRendererTest : public ::testing::Test {
protected:
    config::RenderConfig cfg;
};

TEST_F(WtPdfRendererTest, RendersHealthProbeDocument) {
    WtPdfRenderer renderer(cfg);
    const auto pdf = renderer.render(protocols::http::handler::Health::PROBE_HTML);

    ASSERT_FALSE(pdf.empty());
    const auto text = asText(pdf);
    EXPECT_TRUE(text.starts_with("%PDF-"));
    EXPECT_NE(text.find("%%EOF"), std::string::npos);
}

TEST_F(WtPdfRendererTest, RendersStyledDocument) {
    WtPdfRenderer renderer(cfg);
    const auto pdf = renderer.render(
        "<html><head><style>p{color:red}</style></head><body><h1>Title</h1><p>Body text</p></body></html>");
    EXPECT_TRUE(asText(pdf).starts_with("%PDF-"));
}

TEST_F(WtPdfRendererTest, EveryPageSizeRenders) {
    for (const auto size : {config::PageSize::A3, config::PageSize::A4, config::PageSize::A5,
                            config::PageSize::Letter, config::PageSize::Legal}) {
        cfg.page_size = size;
        WtPdfRenderer renderer(cfg);
        EXPECT_TRUE(asText(renderer.render("<p>size</p>")).starts_with("%PDF-"))
            << config::pageSizeToString(size);
    }
}

TEST_F(WtPdfRendererTest, LandscapeChangesPageGeometry) {
    WtPdfRenderer portrait(cfg);
    cfg.landscape = true;
    WtPdfRenderer landscape(cfg);

    const auto a = portrait.render("<p>orientation</p>");
    const auto b = landscape.render("<p>orientation</p>");

    EXPECT_TRUE(asText(b).starts_with("%PDF-"));
    EXPECT_NE(a, b);
}

TEST_F(WtPdfRendererTest, MalformedXhtmlThrowsRenderError) {
    WtPdfRenderer renderer(cfg);
    EXPECT_THROW(renderer.render("<p>"), render::RenderError);
    EXPECT_THROW(renderer.render("<html><body><p>unterminated"), render::RenderError);
}

TEST_F(WtPdfRendererTest, ConcurrentRendersAreIndependent) {
    WtPdfRenderer renderer(cfg);
    std::vector<std::vector<uint8_t>> results(4);
    std::vector<std::thread> threads;

    for (std::size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i] { results[i] = renderer.render("<p>parallel</p>"); });
    for (auto& t : threads) t.join();

    for (const auto& pdf : results) EXPECT_TRUE(asText(pdf).starts_with("%PDF-"));
}
