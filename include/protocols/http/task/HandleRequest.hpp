#pragma once

#include "concurrency/Task.hpp"
#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "log/Registry.hpp"

namespace folio::protocols::http::task {

struct HandleRequest final : concurrency::Task {
    std::shared_ptr<Session> session;
    std::shared_ptr<const Router> router;
    request req;

    HandleRequest(std::shared_ptr<Session> s, std::shared_ptr<const Router> r, request&& rq)
        : session(std::move(s)), router(std::move(r)), req(std::move(rq)) {}

    void operator()() override {
        try {
            session->write(router->route(req));
        } catch (const std::exception& e) {
            log::Registry::http()->error("[HandleRequest] Exception during request handling: {}", e.what());
            internalError();
        } catch (...) {
            log::Registry::http()->error("[HandleRequest] Non-standard exception during request handling");
            internalError();
        }
    }

private:
    void internalError() {
        auto res = Router::makeErrorResponse(req, "Internal Server Error", status::internal_server_error);
        std::get<string_response>(res).keep_alive(false);
        session->write(std::move(res));
    }
};

}
