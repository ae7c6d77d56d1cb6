#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <memory>
#include <thread>

namespace boost::asio { class io_context; }
namespace folio::config { struct Config; }
namespace folio::render { class Renderer; }
namespace folio::concurrency { class ThreadPool; }
namespace folio::protocols::http { class Server; class Router; }

namespace folio::runtime {

// Owns the io_context thread, the request worker pool and the HTTP server.
class HttpService {
public:
    HttpService(std::shared_ptr<const config::Config> config, std::shared_ptr<render::Renderer> renderer);
    ~HttpService();

    HttpService(const HttpService&) = delete;
    HttpService& operator=(const HttpService&) = delete;

    // Binds the listener and starts serving. Throws if the endpoint cannot be bound.
    void start();

    void stop();

    [[nodiscard]] boost::asio::ip::tcp::endpoint localEndpoint() const;

private:
    std::shared_ptr<const config::Config> config_;
    std::shared_ptr<const protocols::http::Router> router_;

    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    std::shared_ptr<protocols::http::Server> httpServer_;
    std::thread ioThread_;
};

}
