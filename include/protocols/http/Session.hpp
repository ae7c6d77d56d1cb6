#pragma once

#include "protocols/http/model/Response.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <optional>

namespace folio::concurrency { class ThreadPool; }

namespace folio::protocols::http {

class Router;

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

// One keep-alive connection. Reads happen on the connection's strand; each parsed
// request is handed to the worker pool and the response is written back on the strand.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket,
            std::shared_ptr<const Router> router,
            std::shared_ptr<concurrency::ThreadPool> pool,
            std::uint64_t bodyLimit);

    void run();

    // Safe to call from any thread.
    void write(model::Response&& res);

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();
    void respondToParseError(http::status status, const std::string& detail);

    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;

    std::shared_ptr<const Router> router_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    std::uint64_t bodyLimit_;
};

}
