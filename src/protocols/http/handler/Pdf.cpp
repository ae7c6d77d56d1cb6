#include "protocols/http/handler/Pdf.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/model/PdfRequest.hpp"
#include "auth/ApiKeyVerifier.hpp"
#include "render/Renderer.hpp"
#include "render/StyleInjector.hpp"
#include "crypto/util/encoding.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <optional>

using namespace folio::log;

namespace folio::protocols::http::handler {

namespace {

std::optional<std::string_view> header(const request& req, const field f) {
    const auto it = req.find(f);
    if (it == req.end()) return std::nullopt;
    const auto v = it->value();
    return std::string_view{v.data(), v.size()};
}

}

Pdf::Pdf(std::shared_ptr<const auth::ApiKeyVerifier> verifier, std::shared_ptr<render::Renderer> renderer)
    : verifier_(std::move(verifier)), renderer_(std::move(renderer)) {}

model::Response Pdf::handle(const request& req, const Encoding encoding) const {
    model::PdfRequest body;
    try {
        body = model::PdfRequest::parse({req.body().data(), req.body().size()}, header(req, field::content_type));
    } catch (const model::ValidationError& e) {
        Registry::http()->debug("[Pdf] Rejected request body: {}", e.what());
        return Router::makeValidationErrorResponse(req, e);
    }

    if (!verifier_->verify(header(req, field::authorization))) {
        Registry::auth()->warn("[Pdf] Invalid API key provided");
        return Router::makeErrorResponse(req, "Invalid API key", status::unauthorized);
    }

    std::vector<uint8_t> pdf;
    try {
        Registry::render()->info("[Pdf] Starting PDF generation");
        const auto html = render::StyleInjector::inject(body.htmlContent, body.customCss);
        pdf = renderer_->render(html);
    } catch (const std::exception& e) {
        Registry::render()->error("[Pdf] PDF generation failed: {}", e.what());
        return Router::makeErrorResponse(req, std::string("PDF generation failed: ") + e.what(),
                                         status::internal_server_error);
    } catch (...) {
        Registry::render()->error("[Pdf] PDF generation failed with a non-standard exception");
        return Router::makeErrorResponse(req, "PDF generation failed: Unknown error", status::internal_server_error);
    }

    Registry::render()->info("[Pdf] PDF generated successfully, size: {} bytes", pdf.size());

    if (encoding == Encoding::Binary) return Router::makePdfResponse(req, std::move(pdf));

    const auto size = pdf.size();
    return Router::makeJsonResponse(req, nlohmann::json{
        {"pdf", crypto::util::b64_encode(pdf)},
        {"size", size},
        {"encoding", "base64"}
    });
}

}
