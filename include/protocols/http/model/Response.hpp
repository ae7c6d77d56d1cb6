#pragma once

#include <boost/beast/http.hpp>
#include <cstdint>
#include <variant>

namespace folio::protocols::http::model {

namespace http = boost::beast::http;

using Response = std::variant<
    http::response<http::vector_body<uint8_t>>,
    http::response<http::string_body>
>;

}
