#pragma once

#include "protocols/http/model/Response.hpp"

#include <boost/beast/http.hpp>
#include <memory>

namespace folio::render { class Renderer; }

namespace folio::protocols::http::handler {

using request = boost::beast::http::request<boost::beast::http::string_body>;

class Health {
public:
    static constexpr auto* PROBE_HTML = "<html><body>Test</body></html>";

    explicit Health(std::shared_ptr<render::Renderer> renderer);

    // GET /: static liveness payload, never touches the renderer.
    [[nodiscard]] static model::Response root(const request& req);

    // GET /health: renders PROBE_HTML on every call. Renderer failure is reported
    // in the payload, the status code stays 200.
    [[nodiscard]] model::Response probe(const request& req) const;

private:
    std::shared_ptr<render::Renderer> renderer_;
};

}
