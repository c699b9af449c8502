#include <gtest/gtest.h>
#include "todo/cors.hpp"

using namespace todo;

namespace {

HttpRequest make_request(std::string method, std::map<std::string, std::string> headers = {}) {
    HttpRequest request;
    request.method = std::move(method);
    request.path = "/todos";
    request.headers = std::move(headers);
    return request;
}

} // namespace


TEST(CorsTest, PreflightDetection) {
    EXPECT_TRUE(Cors::is_preflight(make_request("OPTIONS", {{"origin", "http://a.example"}})));
    EXPECT_FALSE(Cors::is_preflight(make_request("OPTIONS")));
    EXPECT_FALSE(Cors::is_preflight(make_request("GET", {{"origin", "http://a.example"}})));
}

TEST(CorsTest, PreflightAllowsEverything) {
    Cors cors;
    auto response = cors.preflight(make_request("OPTIONS", {
        {"origin", "http://a.example"},
        {"access-control-request-method", "PUT"},
        {"access-control-request-headers", "content-type, x-token"},
    }));

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("access-control-allow-origin"), "http://a.example");
    EXPECT_EQ(response.header("access-control-allow-methods"), std::string{Cors::ALLOWED_METHODS});
    EXPECT_EQ(response.header("access-control-allow-headers"), "content-type, x-token");
    EXPECT_EQ(response.header("access-control-max-age"), "3600");
    EXPECT_TRUE(response.body.empty());
}

TEST(CorsTest, PreflightWithoutRequestedHeaders) {
    Cors cors;
    auto response = cors.preflight(make_request("OPTIONS", {
        {"origin", "http://a.example"},
        {"access-control-request-method", "GET"},
    }));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("access-control-allow-headers"), std::nullopt);
}

TEST(CorsTest, PreflightWithoutRequestMethodIsBadRequest) {
    Cors cors;
    auto response = cors.preflight(make_request("OPTIONS", {{"origin", "http://a.example"}}));
    EXPECT_EQ(response.status, 400);
}

TEST(CorsTest, CustomMaxAge) {
    Cors cors{std::chrono::seconds{60}};
    auto response = cors.preflight(make_request("OPTIONS", {
        {"origin", "http://a.example"},
        {"access-control-request-method", "GET"},
    }));
    EXPECT_EQ(response.header("access-control-max-age"), "60");
}

TEST(CorsTest, DecorateEchoesOrigin) {
    Cors cors;
    auto response = HttpResponse::json(200, "[]");
    cors.decorate(make_request("GET", {{"origin", "http://b.example"}}), response);
    EXPECT_EQ(response.header("access-control-allow-origin"), "http://b.example");
    EXPECT_EQ(response.header("vary"), "Origin");
}

TEST(CorsTest, DecorateSkipsSameOriginRequests) {
    Cors cors;
    auto response = HttpResponse::json(200, "[]");
    cors.decorate(make_request("GET"), response);
    EXPECT_EQ(response.header("access-control-allow-origin"), std::nullopt);
    EXPECT_EQ(response.headers.size(), 1); // content-type only
}
