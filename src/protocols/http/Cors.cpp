#include "protocols/http/Cors.hpp"

#include <algorithm>

namespace folio::protocols::http {

namespace beast_http = boost::beast::http;
using field = beast_http::field;

namespace {

std::string_view headerValue(const request& req, const field f) {
    const auto it = req.find(f);
    if (it == req.end()) return {};
    const auto v = it->value();
    return {v.data(), v.size()};
}

}

Cors::Cors(std::vector<std::string> allowedOrigins)
    : allowAll_(std::find(allowedOrigins.begin(), allowedOrigins.end(), "*") != allowedOrigins.end()),
      origins_(std::move(allowedOrigins)) {}

bool Cors::isOriginAllowed(const std::string_view origin) const {
    if (allowAll_) return true;
    return std::find(origins_.begin(), origins_.end(), origin) != origins_.end();
}

bool Cors::isMethodAllowed(const std::string_view method) {
    return method == "GET" || method == "POST" || method == "OPTIONS";
}

bool Cors::isPreflight(const request& req) {
    return req.method() == beast_http::verb::options
        && req.find(field::origin) != req.end()
        && req.find(field::access_control_request_method) != req.end();
}

model::Response Cors::preflight(const request& req) const {
    const auto origin = headerValue(req, field::origin);
    const auto method = headerValue(req, field::access_control_request_method);

    std::vector<std::string> failures;
    if (!isOriginAllowed(origin)) failures.emplace_back("origin");
    if (!isMethodAllowed(method)) failures.emplace_back("method");

    beast_http::response<beast_http::string_body> res{
        failures.empty() ? beast_http::status::ok : beast_http::status::bad_request, req.version()};
    res.set(field::content_type, "text/plain; charset=utf-8");

    if (failures.empty()) {
        res.set(field::access_control_allow_origin, origin);
        res.set(field::access_control_allow_methods, ALLOWED_METHODS);
        res.set(field::access_control_allow_credentials, "true");
        res.set(field::access_control_max_age, MAX_AGE);
        res.set(field::vary, "Origin");
        if (const auto requested = headerValue(req, field::access_control_request_headers); !requested.empty())
            res.set(field::access_control_allow_headers, requested);
        res.body() = "OK";
    } else {
        std::string msg = "Disallowed CORS ";
        for (std::size_t i = 0; i < failures.size(); ++i) {
            if (i) msg += ", ";
            msg += failures[i];
        }
        res.body() = std::move(msg);
    }

    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

void Cors::decorate(const request& req, beast_http::fields& headers) const {
    const auto origin = headerValue(req, field::origin);
    if (origin.empty() || !isOriginAllowed(origin)) return;

    headers.set(field::access_control_allow_origin, origin);
    headers.set(field::access_control_allow_credentials, "true");
    headers.set(field::vary, "Origin");
}

}
