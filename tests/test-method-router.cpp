#include <gtest/gtest.h>
#include "../apidoc.h"

#include <string>
#include <vector>

using namespace qb::apidoc;
using qb::apidoc::http::MethodRouter;
using qb::apidoc::http::Request;
using qb::apidoc::http::Response;

namespace {

MethodRouter<>::EndpointFn reply(uint16_t status, std::string body) {
    return [status, body](Request &, const NoState &) { return Response(status, body); };
}

http::Middleware tagging(std::vector<std::string> &trace, std::string name) {
    return [&trace, name](Request &req, const http::Next &next) {
        trace.push_back(name);
        return next(req);
    };
}

} // anonymous namespace

class MethodRouterTest : public ::testing::Test {
protected:
    MethodRouter<> router;
    std::vector<std::string> trace;

    Response send(Method m) {
        Request req(m, "/items");
        return router.call(req);
    }
};

TEST_F(MethodRouterTest, DispatchesByMethod) {
    router.get(reply(200, "list")).post(reply(201, "created"));

    EXPECT_EQ(send(Method::GET).body, "list");
    EXPECT_EQ(send(Method::POST).status, 201);
}

TEST_F(MethodRouterTest, UnregisteredMethodIs405WithAllow) {
    router.get(reply(200, "list")).post(reply(201, "created"));

    Response res = send(Method::PUT);
    EXPECT_EQ(res.status, 405);
    EXPECT_EQ(res.header("Allow"), "GET, POST, HEAD");
}

TEST_F(MethodRouterTest, HeadFallsBackToGetWithoutBody) {
    router.get(reply(200, "payload"));

    Response res = send(Method::HEAD);
    EXPECT_EQ(res.status, 200);
    EXPECT_TRUE(res.body.empty());
}

TEST_F(MethodRouterTest, ExplicitHeadWins) {
    router.get(reply(200, "payload")).head(reply(204, ""));
    EXPECT_EQ(send(Method::HEAD).status, 204);
}

TEST_F(MethodRouterTest, NullEndpointRejected) {
    EXPECT_THROW(router.get(nullptr), std::invalid_argument);
    EXPECT_THROW(router.on(static_cast<Method>(42), reply(200, "")), std::invalid_argument);
    EXPECT_TRUE(router.empty());
}

TEST_F(MethodRouterTest, MethodsInCanonicalOrder) {
    router.patch(reply(200, "")).get(reply(200, "")).del(reply(204, "")).put(reply(200, ""));
    EXPECT_EQ(router.methods(), (std::vector<Method>{Method::GET, Method::PUT, Method::DEL, Method::PATCH}));
}

TEST_F(MethodRouterTest, LayerWrapsEndpointsAndFallback) {
    router.get(reply(200, "list"));
    router.layer(tagging(trace, "outer"));

    send(Method::GET);
    Response res = send(Method::POST);

    EXPECT_EQ(res.status, 405);
    EXPECT_EQ(trace, (std::vector<std::string>{"outer", "outer"}));
}

TEST_F(MethodRouterTest, LayeredFallbackListsMethodsAddedAfterLayering) {
    router.get(reply(200, "list"));
    router.layer(tagging(trace, "inner")).layer(tagging(trace, "outer"));

    MethodRouter<> other;
    other.post(reply(201, "created"));
    router.merge(std::move(other));
    router.patch(reply(200, "patched"));

    Response res = send(Method::PUT);
    EXPECT_EQ(res.status, 405);
    EXPECT_EQ(res.header("Allow"), "GET, POST, HEAD, PATCH");
    EXPECT_EQ(trace, (std::vector<std::string>{"outer", "inner"}));
}

TEST_F(MethodRouterTest, RouteLayerSkipsFallback) {
    router.get(reply(200, "list"));
    router.route_layer(tagging(trace, "route"));

    send(Method::GET);
    send(Method::POST);

    EXPECT_EQ(trace, (std::vector<std::string>{"route"}));
}

TEST_F(MethodRouterTest, LayersNestOutermostLast) {
    router.get(reply(200, "list"));
    router.layer(tagging(trace, "inner")).layer(tagging(trace, "outer"));

    send(Method::GET);
    EXPECT_EQ(trace, (std::vector<std::string>{"outer", "inner"}));
}

TEST_F(MethodRouterTest, MiddlewareCanShortCircuit) {
    router.get(reply(200, "list"));
    router.layer([](Request &, const http::Next &) { return Response(401); });

    EXPECT_EQ(send(Method::GET).status, 401);
}

TEST_F(MethodRouterTest, MergeTakesOtherOnOverlap) {
    router.get(reply(200, "mine")).post(reply(201, "mine"));

    MethodRouter<> other;
    other.get(reply(200, "theirs")).del(reply(204, ""));
    router.merge(std::move(other));

    EXPECT_EQ(send(Method::GET).body, "theirs");
    EXPECT_EQ(send(Method::POST).body, "mine");
    EXPECT_EQ(send(Method::DEL).status, 204);
}

TEST_F(MethodRouterTest, CustomFallback) {
    router.get(reply(200, "")).fallback(reply(418, "teapot"));
    EXPECT_EQ(send(Method::TRACE).status, 418);
}

TEST(MessageTest, HeaderNamesAreCaseInsensitive) {
    Request req(Method::POST, "/");
    req.headers["Content-Type"] = "application/json";
    EXPECT_EQ(req.header("content-type"), "application/json");
    EXPECT_EQ(req.header("CONTENT-TYPE"), "application/json");

    req.set_header("content-type", "text/plain");
    EXPECT_EQ(req.headers.size(), 1u);
    EXPECT_EQ(req.header("Content-Type"), "text/plain");

    Response res = Response::json(200, qb::json::object());
    EXPECT_EQ(res.headers.at("CONTENT-TYPE"), "application/json");
    EXPECT_FALSE(res.header("Allow").has_value());
}

struct Counter {
    int base;
};

TEST(MethodRouterStateTest, WithStateBindsState) {
    MethodRouter<Counter> stateful;
    stateful.get([](Request &, const Counter &c) { return Response(200, std::to_string(c.base)); });

    MethodRouter<> bound = stateful.with_state(Counter{41});
    Request req(Method::GET, "/");
    EXPECT_EQ(bound.call(req).body, "41");

    Request post(Method::POST, "/");
    EXPECT_EQ(bound.call(post).status, 405);
}
