#include "protocols/TcpServerBase.hpp"
#include "log/Registry.hpp"

#include <utility>

namespace folio::protocols {

TcpServerBase::TcpServerBase(asio::io_context& ioc,
                             const tcp::endpoint& endpoint,
                             const TcpServerOptions opts)
    : ioc_(ioc), acceptor_(ioc), opts_(opts) { init_acceptor(acceptor_, endpoint); }

void TcpServerBase::run() {
    logStart();

    const auto n = (opts_.acceptConcurrency == 0) ? 1u : opts_.acceptConcurrency;
    for (unsigned int i = 0; i < n; ++i) doAccept();
}

void TcpServerBase::stop() {
    asio::post(ioc_, [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) log::Registry::http()->warn("[{}] Failed to close acceptor: {}", self->serverName(), ec.message());
    });
}

void TcpServerBase::logStart() const {
    log::Registry::http()->info("[{}] Listening on {}", serverName(), endpointToString(acceptor_));
}

void TcpServerBase::doAccept() {
    auto self = shared_from_this();

    auto handler = [self](const beast::error_code& ec, tcp::socket socket) mutable {
        if (ec == asio::error::operation_aborted) return; // shutting down

        self->doAccept(); // re-arm ASAP

        if (ec) {
            log::Registry::http()->debug("[{}] accept error: {}", self->serverName(), ec.message());
            return;
        }

        self->onAccept(std::move(socket));
    };

    if (opts_.useStrand) acceptor_.async_accept(asio::make_strand(ioc_), std::move(handler));
    else acceptor_.async_accept(std::move(handler));
}

}
