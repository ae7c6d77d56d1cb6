#pragma once

#include "protocols/http/model/Response.hpp"
#include "protocols/http/Cors.hpp"
#include "protocols/http/handler/Pdf.hpp"
#include "protocols/http/handler/Health.hpp"

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>
#include <vector>

namespace folio::config { struct Config; }
namespace folio::render { class Renderer; }

namespace folio::protocols::http {

namespace model { class ValidationError; }

using request = boost::beast::http::request<boost::beast::http::string_body>;

template<class Body>
using response = boost::beast::http::response<Body>;

using string_body = boost::beast::http::string_body;
using vector_body = boost::beast::http::vector_body<uint8_t>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

using string_response = response<string_body>;
using vector_response = response<vector_body>;

class Router {
public:
    Router(const std::shared_ptr<const config::Config>& config, std::shared_ptr<render::Renderer> renderer);

    // Runs the whole request: CORS preflight or dispatch, then CORS and Server headers.
    [[nodiscard]] model::Response route(const request& req) const;

    static model::Response makePdfResponse(const request& req, std::vector<uint8_t>&& data);

    static model::Response makeJsonResponse(const request& req, const nlohmann::json& j,
                                            status s = status::ok);

    // {"detail": msg}
    static model::Response makeErrorResponse(const request& req, const std::string& msg, status s);

    static model::Response makeValidationErrorResponse(const request& req, const model::ValidationError& e);

private:
    model::Response dispatch(const request& req) const;

    static model::Response methodNotAllowed(const request& req, const char* allow);

    Cors cors_;
    handler::Pdf pdf_;
    handler::Health health_;
};

}
