#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/task/HandleRequest.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

using namespace folio::log;

namespace folio::protocols::http {

Session::Session(tcp::socket socket,
                 std::shared_ptr<const Router> router,
                 std::shared_ptr<concurrency::ThreadPool> pool,
                 const std::uint64_t bodyLimit)
    : socket_(std::move(socket)), router_(std::move(router)), pool_(std::move(pool)), bodyLimit_(bodyLimit) {
    buffer_.max_size(bodyLimit_ + 64 * 1024);
}

void Session::run() {
    // Start on the socket's strand so every handler shares one executor.
    boost::asio::dispatch(socket_.get_executor(), [self = shared_from_this()] { self->do_read(); });
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(bodyLimit_);

    http::async_read(socket_, buffer_, *parser_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec == http::error::body_limit) {
        Registry::http()->warn("[Session] Request body exceeds {} bytes", bodyLimit_);
        return respondToParseError(http::status::payload_too_large, "Request body too large");
    }

    if (ec) {
        if (ec.category() == http::make_error_code(http::error::bad_target).category()) {
            Registry::http()->debug("[Session] Malformed request: {}", ec.message());
            return respondToParseError(http::status::bad_request, "Bad Request");
        }
        if (ec != boost::asio::error::operation_aborted && ec != boost::asio::error::connection_reset)
            Registry::http()->error("[Session] Read error: {}", ec.message());
        return do_close();
    }

    Registry::http()->debug("[Session] Read {} bytes", bytes);

    if (pool_->busyCount() >= pool_->workerCount())
        Registry::http()->debug("[Session] All {} workers busy, {} request(s) already queued",
                                pool_->workerCount(), pool_->queueDepth());

    try {
        pool_->submit(std::make_shared<task::HandleRequest>(shared_from_this(), router_, parser_->release()));
    } catch (const std::exception& e) {
        Registry::http()->error("[Session] Failed to schedule request: {}", e.what());
        do_close();
    }
}

void Session::respondToParseError(const http::status status, const std::string& detail) {
    auto res = Router::makeErrorResponse(parser_->get(), detail, status);
    std::get<string_response>(res).keep_alive(false);
    write(std::move(res));
}

void Session::write(model::Response&& res) {
    boost::asio::post(socket_.get_executor(), [self = shared_from_this(), res = std::move(res)]() mutable {
        std::visit([&self](auto&& response) {
            using T = std::decay_t<decltype(response)>;
            auto msg = std::make_shared<T>(std::move(response));
            const bool close = msg->need_eof();
            http::async_write(self->socket_, *msg,
                              [self, msg, close](beast::error_code ec, std::size_t bytes) {
                                  self->on_write(close, ec, bytes);
                              });
        }, std::move(res));
    });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    if (ec) {
        Registry::http()->error("[Session] Write error: {}", ec.message());
        return do_close();
    }

    Registry::http()->debug("[Session] Wrote {} bytes", bytes);

    if (close) return do_close();

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        Registry::http()->debug("[Session] Shutdown error: {}", ec.message());
}

}
