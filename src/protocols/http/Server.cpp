#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "concurrency/ThreadPool.hpp"

using namespace folio::protocols::http;

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<const Router> router,
               std::shared_ptr<concurrency::ThreadPool> pool,
               const std::uint64_t bodyLimit)
    : TcpServerBase(ioc, endpoint, protocols::TcpServerOptions{
          .acceptConcurrency = 1,
          .useStrand = true
      }),
      router_(std::move(router)), pool_(std::move(pool)), bodyLimit_(bodyLimit) {}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket), router_, pool_, bodyLimit_)->run();
}
