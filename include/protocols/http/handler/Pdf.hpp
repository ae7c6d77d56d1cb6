#pragma once

#include "protocols/http/model/Response.hpp"

#include <boost/beast/http.hpp>
#include <memory>

namespace folio::auth { class ApiKeyVerifier; }
namespace folio::render { class Renderer; }

namespace folio::protocols::http::handler {

using request = boost::beast::http::request<boost::beast::http::string_body>;

// POST /generate-pdf and /generate-pdf-base64: validate body, check the bearer key,
// inject custom CSS, render, then serialize raw or as base64 JSON.
class Pdf {
public:
    enum class Encoding { Binary, Base64 };

    Pdf(std::shared_ptr<const auth::ApiKeyVerifier> verifier, std::shared_ptr<render::Renderer> renderer);

    [[nodiscard]] model::Response handle(const request& req, Encoding encoding) const;

private:
    std::shared_ptr<const auth::ApiKeyVerifier> verifier_;
    std::shared_ptr<render::Renderer> renderer_;
};

}
