#pragma once

#include "protocols/http/model/Response.hpp"

#include <boost/beast/http.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace folio::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;

// Cross-origin policy: configured origins may use GET, POST and OPTIONS with any
// header, credentials included. "*" allows every origin.
class Cors {
public:
    static constexpr auto* ALLOWED_METHODS = "GET, POST, OPTIONS";
    static constexpr auto* MAX_AGE = "600";

    explicit Cors(std::vector<std::string> allowedOrigins);

    [[nodiscard]] bool isOriginAllowed(std::string_view origin) const;

    [[nodiscard]] static bool isMethodAllowed(std::string_view method);

    // OPTIONS carrying both Origin and Access-Control-Request-Method.
    [[nodiscard]] static bool isPreflight(const request& req);

    [[nodiscard]] model::Response preflight(const request& req) const;

    // Adds the allow-origin headers to a response when the request's Origin is allowed.
    void decorate(const request& req, boost::beast::http::fields& headers) const;

private:
    bool allowAll_;
    std::vector<std::string> origins_;
};

}
