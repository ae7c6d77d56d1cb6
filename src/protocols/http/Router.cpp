#include "protocols/http/Router.hpp"
#include "protocols/http/model/PdfRequest.hpp"
#include "auth/ApiKeyVerifier.hpp"
#include "config/Config.hpp"
#include "render/Renderer.hpp"
#include "runtime/ServiceInfo.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace folio::protocols::http;
using namespace folio::log;

namespace {

std::string_view pathOf(const request& req) {
    const auto target = req.target();
    const std::string_view t{target.data(), target.size()};
    return t.substr(0, t.find('?'));
}

// Collaborator error text is not guaranteed to be valid UTF-8.
std::string dumpJson(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}

Router::Router(const std::shared_ptr<const config::Config>& config, std::shared_ptr<render::Renderer> renderer)
    : cors_(config->cors.allowed_origins),
      pdf_(std::make_shared<const auth::ApiKeyVerifier>(config->auth.api_key), renderer),
      health_(renderer) {}

model::Response Router::route(const request& req) const {
    auto res = Cors::isPreflight(req) ? cors_.preflight(req) : dispatch(req);

    std::visit([&](auto& r) {
        cors_.decorate(req, r);
        r.set(field::server, runtime::SERVER_HEADER);
    }, res);

    return res;
}

model::Response Router::dispatch(const request& req) const {
    const auto path = pathOf(req);
    Registry::http()->debug("[Router] {} {}", std::string_view{req.method_string().data(), req.method_string().size()}, path);

    if (path == "/") {
        if (req.method() != verb::get) return methodNotAllowed(req, "GET");
        return handler::Health::root(req);
    }

    if (path == "/health") {
        if (req.method() != verb::get) return methodNotAllowed(req, "GET");
        return health_.probe(req);
    }

    if (path == "/generate-pdf") {
        if (req.method() != verb::post) return methodNotAllowed(req, "POST");
        return pdf_.handle(req, handler::Pdf::Encoding::Binary);
    }

    if (path == "/generate-pdf-base64") {
        if (req.method() != verb::post) return methodNotAllowed(req, "POST");
        return pdf_.handle(req, handler::Pdf::Encoding::Base64);
    }

    return makeErrorResponse(req, "Not Found", status::not_found);
}

model::Response Router::methodNotAllowed(const request& req, const char* allow) {
    auto res = makeErrorResponse(req, "Method Not Allowed", status::method_not_allowed);
    std::get<string_response>(res).set(field::allow, allow);
    return res;
}

model::Response Router::makePdfResponse(const request& req, std::vector<uint8_t>&& data) {
    const auto size = data.size();

    vector_response res{
        std::piecewise_construct,
        std::make_tuple(std::move(data)),
        std::make_tuple(status::ok, req.version())
    };

    res.set(field::content_type, "application/pdf");
    res.set(field::content_disposition, "attachment; filename=document.pdf");
    res.content_length(size);
    res.keep_alive(req.keep_alive());
    return res;
}

model::Response Router::makeJsonResponse(const request& req, const nlohmann::json& j, const status s) {
    string_response res{s, req.version()};
    res.set(field::content_type, "application/json");
    res.body() = dumpJson(j);
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

model::Response Router::makeErrorResponse(const request& req, const std::string& msg, const status s) {
    return makeJsonResponse(req, nlohmann::json{{"detail", msg}}, s);
}

model::Response Router::makeValidationErrorResponse(const request& req, const model::ValidationError& e) {
    return makeJsonResponse(req, nlohmann::json{{"detail", e.errors()}}, status::unprocessable_entity);
}
