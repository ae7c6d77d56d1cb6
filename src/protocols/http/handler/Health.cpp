#include "protocols/http/handler/Health.hpp"
#include "protocols/http/Router.hpp"
#include "render/Renderer.hpp"
#include "runtime/ServiceInfo.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace folio::log;

namespace folio::protocols::http::handler {

namespace {

constexpr auto* UNKNOWN_ERROR = "Unknown renderer error";

model::Response unhealthy(const request& req, const std::string& error) {
    return Router::makeJsonResponse(req, nlohmann::json{{"status", "unhealthy"}, {"error", error}});
}

}

Health::Health(std::shared_ptr<render::Renderer> renderer) : renderer_(std::move(renderer)) {}

model::Response Health::root(const request& req) {
    return Router::makeJsonResponse(req, nlohmann::json{
        {"status", "healthy"},
        {"service", runtime::SERVICE_NAME},
        {"version", runtime::SERVICE_VERSION}
    });
}

model::Response Health::probe(const request& req) const {
    try {
        const auto pdf = renderer_->render(PROBE_HTML);
        Registry::render()->debug("[Health] Probe rendered {} bytes", pdf.size());

        return Router::makeJsonResponse(req, nlohmann::json{
            {"status", "healthy"},
            {"weasyprint", "functional"},
            {"pdf_generation", "working"}
        });
    } catch (const std::exception& e) {
        Registry::render()->error("[Health] Health check failed: {}", e.what());
        return unhealthy(req, *e.what() ? e.what() : UNKNOWN_ERROR);
    } catch (...) {
        Registry::render()->error("[Health] Health check failed with a non-standard exception");
        return unhealthy(req, UNKNOWN_ERROR);
    }
}

}
