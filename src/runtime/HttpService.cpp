#include "runtime/HttpService.hpp"
#include "config/Config.hpp"
#include "concurrency/ThreadPool.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"
#include "protocols/TcpAcceptorUtil.hpp"
#include "render/Renderer.hpp"
#include "log/Registry.hpp"

#include <boost/asio/io_context.hpp>

using namespace folio::runtime;
using namespace folio::protocols;
using namespace folio::concurrency;

HttpService::HttpService(std::shared_ptr<const config::Config> config, std::shared_ptr<render::Renderer> renderer)
    : config_(std::move(config)),
      router_(std::make_shared<const http::Router>(config_, std::move(renderer))) {}

HttpService::~HttpService() { stop(); }

void HttpService::start() {
    const auto& cfg = *config_;

    ioContext_ = std::make_shared<asio::io_context>(1);
    pool_ = std::make_shared<ThreadPool>(cfg.renderWorkers());

    const auto endpoint = makeEndpoint(cfg.server.host, cfg.server.port);
    httpServer_ = std::make_shared<http::Server>(*ioContext_, endpoint, router_, pool_, cfg.server.max_body_size_bytes);
    httpServer_->run();

    log::Registry::folio()->info("[HttpService] {} render workers, body limit {} bytes",
                                 pool_->workerCount(), cfg.server.max_body_size_bytes);

    ioThread_ = std::thread([ctx = ioContext_] { ctx->run(); });
}

void HttpService::stop() {
    if (httpServer_) httpServer_->stop();
    if (ioContext_) ioContext_->stop();
    if (ioThread_.joinable()) ioThread_.join();
    if (pool_) pool_->stop();

    httpServer_.reset();
    pool_.reset();
    ioContext_.reset();
}

folio::protocols::tcp::endpoint HttpService::localEndpoint() const {
    if (!httpServer_) throw std::runtime_error("HttpService not started");
    return httpServer_->localEndpoint();
}
