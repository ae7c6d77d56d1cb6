#include <gtest/gtest.h>
#include "FakeRenderer.hpp"
#include "config/Config.hpp"
#include "crypto/util/encoding.hpp"
#include "protocols/http/Router.hpp"
#include "runtime/ServiceInfo.hpp"

#include <nlohmann/json.hpp>
#include <variant>

using namespace folio;
using namespace folio::protocols::http;
using json = nlohmann::json;

class RouterTest : public ::testing::Test {
protected:
    static constexpr auto* API_KEY = "router-test-key";

    std::shared_ptr<config::Config> cfg;
    std::shared_ptr<test::FakeRenderer> renderer;
    std::unique_ptr<Router> router;

    void SetUp() override {
        cfg = std::make_shared<config::Config>();
        cfg->auth.api_key = API_KEY;
        cfg->cors.allowed_origins = {"https://app.example.com"};
        renderer = std::make_shared<test::FakeRenderer>();
        rebuild();
    }

    void rebuild() { router = std::make_unique<Router>(cfg, renderer); }

    static request makeRequest(const verb method, const std::string& target, const std::string& body = "") {
        request req{method, target, 11};
        req.set(field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    static request pdfRequest(const std::string& target, const json& body,
                              const std::optional<std::string>& auth = std::nullopt) {
        auto req = makeRequest(verb::post, target, body.dump());
        if (auth) req.set(field::authorization, *auth);
        return req;
    }

    static const string_response& asString(const model::Response& res) {
        EXPECT_TRUE(std::holds_alternative<string_response>(res));
        return std::get<string_response>(res);
    }

    static const vector_response& asPdf(const model::Response& res) {
        EXPECT_TRUE(std::holds_alternative<vector_response>(res));
        return std::get<vector_response>(res);
    }

    static json bodyJson(const model::Response& res) { return json::parse(asString(res).body()); }

    static boost::beast::http::status statusOf(const model::Response& res) {
        return std::visit([](const auto& r) { return r.result(); }, res);
    }
};

TEST_F(RouterTest, MissingAuthorizationStillRenders) {
    const auto res = router->route(pdfRequest("/generate-pdf", {{"htmlContent", "<p>x</p>"}}));
    EXPECT_EQ(statusOf(res), status::ok);
    EXPECT_EQ(renderer->callCount(), 1u);
}

TEST_F(RouterTest, WrongTokenIsRejectedWithoutRendering) {
    const auto res = router->route(pdfRequest("/generate-pdf", {{"htmlContent", "<p>x</p>"}}, "Bearer nope"));
    EXPECT_EQ(statusOf(res), status::unauthorized);
    EXPECT_EQ(bodyJson(res), (json{{"detail", "Invalid API key"}}));
    EXPECT_EQ(renderer->callCount(), 0u);
}

TEST_F(RouterTest, WrongTokenOnBase64RouteIsRejectedWithoutRendering) {
    const auto res = router->route(pdfRequest("/generate-pdf-base64", {{"htmlContent", "x"}}, "Bearer nope"));
    EXPECT_EQ(statusOf(res), status::unauthorized);
    EXPECT_EQ(renderer->callCount(), 0u);
}

TEST_F(RouterTest, MalformedAuthorizationIsRejected) {
    for (const auto* header : {"Basic x", "Bearer", "Bearer a b"}) {
        const auto res = router->route(pdfRequest("/generate-pdf", {{"htmlContent", "x"}}, std::string(header)));
        EXPECT_EQ(statusOf(res), status::unauthorized) << header;
    }
    EXPECT_EQ(renderer->callCount(), 0u);
}

TEST_F(RouterTest, CorrectTokenRendersPdf) {
    const auto res = router->route(pdfRequest("/generate-pdf", {{"htmlContent", "<p>x</p>"}},
                                              std::string("Bearer ") + API_KEY));
    const auto& pdf = asPdf(res);

    EXPECT_EQ(pdf.result(), status::ok);
    EXPECT_EQ(pdf[field::content_type], "application/pdf");
    EXPECT_EQ(pdf[field::content_disposition], "attachment; filename=document.pdf");
    EXPECT_EQ(pdf[field::content_length], std::to_string(renderer->output.size()));
    EXPECT_EQ(pdf.body(), renderer->output);
    EXPECT_EQ(renderer->lastHtml(), "<p>x</p>");
}

TEST_F(RouterTest, CustomCssIsInjectedBeforeRendering) {
    const auto res = router->route(pdfRequest("/generate-pdf",
                                              {{"htmlContent", "<body>Hi</body>"}, {"customCss", "b{}"}}));
    EXPECT_EQ(statusOf(res), status::ok);
    EXPECT_EQ(renderer->lastHtml(), "<head><style>b{}</style></head><body>Hi</body>");
}

TEST_F(RouterTest, Base64MatchesBinaryBytes) {
    const json body{{"htmlContent", "<html><head></head><body>Same</body></html>"}, {"customCss", "p{}"}};

    const auto raw = router->route(pdfRequest("/generate-pdf", body));
    const auto encoded = router->route(pdfRequest("/generate-pdf-base64", body));

    const auto& rawBytes = asPdf(raw).body();
    const auto j = bodyJson(encoded);

    EXPECT_EQ(j["encoding"], "base64");
    EXPECT_EQ(j["size"].get<std::size_t>(), rawBytes.size());
    EXPECT_EQ(crypto::util::b64_decode(j["pdf"].get<std::string>()), rawBytes);
    EXPECT_EQ(asString(encoded)[field::content_type], "application/json");
}

TEST_F(RouterTest, RenderFailureYields500WithoutPdf) {
    renderer->failWith = "engine exploded";

    for (const auto* target : {"/generate-pdf", "/generate-pdf-base64"}) {
        const auto res = router->route(pdfRequest(target, {{"htmlContent", "x"}}));
        ASSERT_TRUE(std::holds_alternative<string_response>(res)) << target;
        EXPECT_EQ(statusOf(res), status::internal_server_error) << target;
        EXPECT_EQ(bodyJson(res), (json{{"detail", "PDF generation failed: engine exploded"}})) << target;
    }
}

TEST_F(RouterTest, NonStandardRenderFailureYields500) {
    renderer->throwNonStandard = true;

    for (const auto* target : {"/generate-pdf", "/generate-pdf-base64"}) {
        const auto res = router->route(pdfRequest(target, {{"htmlContent", "x"}}));
        EXPECT_EQ(statusOf(res), status::internal_server_error) << target;
        EXPECT_EQ(bodyJson(res), (json{{"detail", "PDF generation failed: Unknown error"}})) << target;
    }
}

TEST_F(RouterTest, HealthReportsNonStandardFailureAsUnhealthy) {
    renderer->throwNonStandard = true;
    const auto res = router->route(makeRequest(verb::get, "/health"));
    EXPECT_EQ(statusOf(res), status::ok);

    const auto j = bodyJson(res);
    EXPECT_EQ(j["status"], "unhealthy");
    EXPECT_EQ(j["error"], "Unknown renderer error");
}

TEST_F(RouterTest, NonJsonContentTypeIs422) {
    auto req = pdfRequest("/generate-pdf", {{"htmlContent", "x"}});
    req.set(field::content_type, "text/plain");

    const auto res = router->route(req);
    EXPECT_EQ(statusOf(res), status::unprocessable_entity);
    EXPECT_EQ(bodyJson(res)["detail"][0]["type"], "model_attributes_type");
    EXPECT_EQ(renderer->callCount(), 0u);
}

TEST_F(RouterTest, MissingContentTypeIsReadAsJson) {
    auto req = pdfRequest("/generate-pdf", {{"htmlContent", "x"}});
    req.erase(field::content_type);

    EXPECT_EQ(statusOf(router->route(req)), status::ok);
    EXPECT_EQ(renderer->callCount(), 1u);
}

TEST_F(RouterTest, HealthReportsHealthyRenderer) {
    const auto res = router->route(makeRequest(verb::get, "/health"));
    EXPECT_EQ(statusOf(res), status::ok);
    EXPECT_EQ(bodyJson(res), (json{{"status", "healthy"}, {"weasyprint", "functional"}, {"pdf_generation", "working"}}));
    EXPECT_EQ(renderer->lastHtml(), "<html><body>Test</body></html>");
}

TEST_F(RouterTest, HealthReportsUnhealthyRendererWith200) {
    renderer->failWith = "no fonts";
    const auto res = router->route(makeRequest(verb::get, "/health"));
    EXPECT_EQ(statusOf(res), status::ok);

    const auto j = bodyJson(res);
    EXPECT_EQ(j["status"], "unhealthy");
    EXPECT_EQ(j["error"], "no fonts");
}

TEST_F(RouterTest, HealthProbesOnEveryCall) {
    EXPECT_EQ(statusOf(router->route(makeRequest(verb::get, "/health"))), status::ok);
    EXPECT_EQ(statusOf(router->route(makeRequest(verb::get, "/health"))), status::ok);
    EXPECT_EQ(renderer->callCount(), 2u);
}

TEST_F(RouterTest, RootReturnsStaticPayload) {
    const auto res = router->route(makeRequest(verb::get, "/"));
    EXPECT_EQ(statusOf(res), status::ok);
    EXPECT_EQ(bodyJson(res), (json{{"status", "healthy"}, {"service", runtime::SERVICE_NAME},
                                   {"version", runtime::SERVICE_VERSION}}));
    EXPECT_EQ(renderer->callCount(), 0u);
}

TEST_F(RouterTest, QueryStringIsIgnoredForRouting) {
    EXPECT_EQ(statusOf(router->route(makeRequest(verb::get, "/?probe=1"))), status::ok);
}

TEST_F(RouterTest, UnknownPathIs404) {
    const auto res = router->route(makeRequest(verb::get, "/nope"));
    EXPECT_EQ(statusOf(res), status::not_found);
    EXPECT_EQ(bodyJson(res), (json{{"detail", "Not Found"}}));
}

TEST_F(RouterTest, WrongMethodIs405WithAllow) {
    const auto res = router->route(makeRequest(verb::get, "/generate-pdf"));
    EXPECT_EQ(statusOf(res), status::method_not_allowed);
    EXPECT_EQ(bodyJson(res), (json{{"detail", "Method Not Allowed"}}));
    EXPECT_EQ(asString(res)[field::allow], "POST");

    const auto health = router->route(makeRequest(verb::post, "/health"));
    EXPECT_EQ(asString(health)[field::allow], "GET");
}

TEST_F(RouterTest, InvalidBodyIs422BeforeAuth) {
    auto req = makeRequest(verb::post, "/generate-pdf", R"({"customCss":"a{}"})");
    req.set(field::authorization, "Bearer nope");

    const auto res = router->route(req);
    EXPECT_EQ(statusOf(res), status::unprocessable_entity);

    const auto j = bodyJson(res);
    ASSERT_TRUE(j["detail"].is_array());
    EXPECT_EQ(j["detail"][0]["type"], "missing");
    EXPECT_EQ(j["detail"][0]["loc"], json::array({"body", "htmlContent"}));
    EXPECT_EQ(renderer->callCount(), 0u);
}

TEST_F(RouterTest, MalformedJsonIs422) {
    const auto res = router->route(makeRequest(verb::post, "/generate-pdf-base64", "{not json"));
    EXPECT_EQ(statusOf(res), status::unprocessable_entity);
    EXPECT_EQ(bodyJson(res)["detail"][0]["type"], "json_invalid");
}

TEST_F(RouterTest, EveryResponseCarriesServerHeader) {
    const auto ok = router->route(makeRequest(verb::get, "/"));
    const auto missing = router->route(makeRequest(verb::get, "/missing"));
    const auto pdf = router->route(pdfRequest("/generate-pdf", {{"htmlContent", "x"}}));

    EXPECT_EQ(asString(ok)[field::server], runtime::SERVER_HEADER);
    EXPECT_EQ(asString(missing)[field::server], runtime::SERVER_HEADER);
    EXPECT_EQ(asPdf(pdf)[field::server], runtime::SERVER_HEADER);
}

TEST_F(RouterTest, PreflightIsAnsweredWithoutDispatch) {
    auto req = makeRequest(verb::options, "/generate-pdf");
    req.set(field::origin, "https://app.example.com");
    req.set(field::access_control_request_method, "POST");

    const auto res = router->route(req);
    EXPECT_EQ(statusOf(res), status::ok);
    EXPECT_EQ(asString(res)[field::access_control_allow_origin], "https://app.example.com");
    EXPECT_EQ(renderer->callCount(), 0u);
}

TEST_F(RouterTest, PreflightFromUnknownOriginIsRejected) {
    auto req = makeRequest(verb::options, "/generate-pdf");
    req.set(field::origin, "https://evil.test");
    req.set(field::access_control_request_method, "POST");

    EXPECT_EQ(statusOf(router->route(req)), status::bad_request);
}

TEST_F(RouterTest, AllowedOriginIsEchoedOnNormalResponses) {
    auto req = pdfRequest("/generate-pdf", {{"htmlContent", "x"}});
    req.set(field::origin, "https://app.example.com");

    const auto res = router->route(req);
    EXPECT_EQ(asPdf(res)[field::access_control_allow_origin], "https://app.example.com");
    EXPECT_EQ(asPdf(res)[field::access_control_allow_credentials], "true");
}

TEST_F(RouterTest, DefaultOriginsAllowEverything) {
    cfg->cors.allowed_origins = {"*"};
    rebuild();

    auto req = makeRequest(verb::get, "/");
    req.set(field::origin, "https://anywhere.test");
    EXPECT_EQ(asString(router->route(req))[field::access_control_allow_origin], "https://anywhere.test");
}

TEST_F(RouterTest, KeepAliveFollowsRequest) {
    auto req = makeRequest(verb::get, "/");
    req.keep_alive(false);
    EXPECT_FALSE(asString(router->route(req)).keep_alive());
}
