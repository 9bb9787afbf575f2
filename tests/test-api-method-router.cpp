#include <gtest/gtest.h>
#include "../apidoc.h"

#include <memory>
#include <string>

using namespace qb::apidoc;
namespace apidoc = qb::apidoc;
using qb::apidoc::http::Request;
using qb::apidoc::openapi::Operation;
using qb::apidoc::openapi::PathItem;

namespace {

openapi::Response described(const std::string &desc) {
    return openapi::Response(desc);
}

// Output documenting 200 and 404.
struct UserOrNotFound {
    bool found = true;

    http::Response into_response() && {
        return found ? http::Response::text(200, "user") : http::Response::text(404, "no such user");
    }

    static InferredResponses inferred_responses(GenContext &, Operation &) {
        return {{OutcomeKey::status(200), described("the user")},
                {OutcomeKey::status(404), described("user not found")}};
    }
};

// Output claiming 200 twice.
struct DoubleOk {
    http::Response into_response() && { return http::Response(200); }

    static InferredResponses inferred_responses(GenContext &, Operation &) {
        return {{OutcomeKey::status(200), described("first ok")},
                {OutcomeKey::status(200), described("second ok")}};
    }
};

// Output claiming the default response twice.
struct DoubleDefault {
    http::Response into_response() && { return http::Response(200); }

    static InferredResponses inferred_responses(GenContext &, Operation &) {
        return {{OutcomeKey::fallback(), described("a")}, {OutcomeKey::fallback(), described("b")}};
    }
};

// Input that can reject with 422 before the handler runs.
struct Validated {
    static std::optional<Validated> from_request(const Request &req, http::Response &rejection) {
        if (req.header("X-Invalid")) {
            rejection = http::Response::text(422, "invalid");
            return std::nullopt;
        }
        return Validated{};
    }

    static void operation_input(GenContext &ctx, Operation &op) {
        add_parameters(ctx, op, {openapi::make_parameter("X-Invalid", "header", {{"type", "string"}})});
    }

    static InferredResponses inferred_early_responses(GenContext &, Operation &) {
        return {{OutcomeKey::status(422), described("validation failed")}};
    }
};

// Input documenting its own 404, overriding the output's.
struct Lookup {
    static std::optional<Lookup> from_request(const Request &, http::Response &) { return Lookup{}; }

    static InferredResponses inferred_early_responses(GenContext &, Operation &) {
        return {{OutcomeKey::status(404), described("lookup failed")}};
    }
};

UserOrNotFound show_user(Validated) { return {}; }
UserOrNotFound lookup_user(Lookup) { return {false}; }
DoubleOk double_ok() { return {}; }
DoubleDefault double_default() { return {}; }
http::Response plain() { return http::Response::text(200, "plain"); }

const openapi::Response &response_at(const PathItem &item, Method m, uint16_t status) {
    const auto *res = item.get(m)->responses.find(OutcomeKey::status(status));
    if (!res) {
        throw std::runtime_error("no response " + std::to_string(status));
    }
    return *res;
}

} // anonymous namespace

class ApiMethodRouterTest : public ::testing::Test {
protected:
    GenContext ctx;
    std::unique_ptr<GenScope> scope;

    void SetUp() override { scope = std::make_unique<GenScope>(ctx); }
    void TearDown() override { scope.reset(); }

    static http::Response send(const ApiMethodRouter<> &router, Method m) {
        Request req(m, "/users/1");
        return router.call(req);
    }
};

TEST_F(ApiMethodRouterTest, OutputAndEarlyResponsesCombine) {
    auto router = apidoc::get(show_user);
    PathItem item = router.take_path_item();

    ASSERT_NE(item.get(Method::GET), nullptr);
    EXPECT_EQ(item.get(Method::GET)->responses.status_codes(), (std::vector<uint16_t>{200, 404, 422}));
    EXPECT_TRUE(ctx.errors().empty());
    EXPECT_NE(item.get(Method::GET)->find_parameter("X-Invalid", "header"), nullptr);
}

TEST_F(ApiMethodRouterTest, SecondOutputAtSameStatusIsOneConflict) {
    auto router = apidoc::get(double_ok);
    PathItem item = router.take_path_item();

    ASSERT_EQ(ctx.errors().size(), 1u);
    EXPECT_EQ(ctx.errors()[0].kind, ErrorKind::InferredResponseConflict);
    EXPECT_EQ(ctx.errors()[0].status, 200);
    EXPECT_EQ(response_at(item, Method::GET, 200).description, "first ok");
}

TEST_F(ApiMethodRouterTest, DefaultConflictHasItsOwnKind) {
    auto router = apidoc::get(double_default);

    ASSERT_EQ(ctx.errors().size(), 1u);
    EXPECT_EQ(ctx.errors()[0].kind, ErrorKind::InferredDefaultResponseConflict);
    EXPECT_EQ(router.operations().at(Method::GET).responses.find(OutcomeKey::fallback())->description, "a");
}

TEST_F(ApiMethodRouterTest, EarlyResponseOverridesOutput) {
    auto router = apidoc::get(lookup_user);
    PathItem item = router.take_path_item();

    EXPECT_TRUE(ctx.errors().empty());
    EXPECT_EQ(response_at(item, Method::GET, 404).description, "lookup failed");
    EXPECT_EQ(response_at(item, Method::GET, 200).description, "the user");
}

TEST_F(ApiMethodRouterTest, HiddenOperationStillDispatches) {
    auto router = apidoc::get_with(show_user, [](TransformOperation op) { return op.hidden(); });

    EXPECT_EQ(send(router, Method::GET).status, 200);
    PathItem item = router.take_path_item();
    EXPECT_EQ(item.get(Method::GET), nullptr);
    EXPECT_TRUE(item.empty());
}

TEST_F(ApiMethodRouterTest, MergeGetWithPost) {
    auto router = apidoc::get(show_user);
    router.merge(apidoc::post(plain));

    EXPECT_EQ(send(router, Method::POST).body, "plain");
    PathItem item = router.take_path_item();
    EXPECT_NE(item.get(Method::GET), nullptr);
    EXPECT_NE(item.get(Method::POST), nullptr);
}

TEST_F(ApiMethodRouterTest, MergeSameMethodLastWins) {
    auto router = apidoc::get_with(plain, [](TransformOperation op) { return op.summary("first"); });
    router.merge(apidoc::get_with(lookup_user, [](TransformOperation op) { return op.summary("second"); }));

    EXPECT_EQ(send(router, Method::GET).status, 404);
    EXPECT_EQ(router.operations().at(Method::GET).summary, "second");
    EXPECT_TRUE(ctx.errors().empty());
}

TEST_F(ApiMethodRouterTest, MergeHiddenDropsStaleDocumentation) {
    auto router = apidoc::get(show_user);
    router.merge(apidoc::get_with(plain, [](TransformOperation op) { return op.hidden(); }));

    EXPECT_EQ(send(router, Method::GET).body, "plain");
    EXPECT_TRUE(router.operations().empty());
}

TEST_F(ApiMethodRouterTest, WrapsUndocumentedMethodRouter) {
    http::MethodRouter<> raw;
    raw.get([](Request &, const NoState &) { return http::Response::text(200, "raw"); });

    ApiMethodRouter<> router(std::move(raw));
    router.post(plain);

    EXPECT_EQ(send(router, Method::GET).body, "raw");
    PathItem item = router.take_path_item();
    EXPECT_EQ(item.get(Method::GET), nullptr);
    EXPECT_NE(item.get(Method::POST), nullptr);
}

TEST_F(ApiMethodRouterTest, MergeUndocumentedMethodRouter) {
    auto router = apidoc::get(show_user).post(plain);

    http::MethodRouter<> raw;
    raw.get([](Request &, const NoState &) { return http::Response::text(200, "raw"); })
       .del([](Request &, const NoState &) { return http::Response(204); });
    router.merge(std::move(raw));

    EXPECT_EQ(send(router, Method::GET).body, "raw");
    EXPECT_EQ(send(router, Method::DEL).status, 204);
    EXPECT_EQ(router.operations().count(Method::GET), 0u);
    EXPECT_EQ(router.operations().count(Method::DEL), 0u);
    EXPECT_EQ(router.operations().count(Method::POST), 1u);
}

TEST_F(ApiMethodRouterTest, IntoRouterKeepsHandlers) {
    auto router = apidoc::get(show_user).del(plain);

    http::MethodRouter<> raw = std::move(router).into_router();
    EXPECT_EQ(raw.methods(), (std::vector<Method>{Method::GET, Method::DEL}));

    Request req(Method::DEL, "/users/1");
    EXPECT_EQ(raw.call(req).body, "plain");
}

TEST_F(ApiMethodRouterTest, DrainTwiceYieldsEmpty) {
    auto router = apidoc::get(show_user);
    router.put(plain);

    PathItem first = router.take_path_item();
    PathItem second = router.take_path_item();

    EXPECT_EQ(first.size(), 2u);
    EXPECT_TRUE(second.empty());
    EXPECT_EQ(send(router, Method::PUT).status, 200);
}

TEST_F(ApiMethodRouterTest, LayersDoNotTouchDocumentation) {
    int calls = 0;
    auto router = apidoc::get(show_user);
    router.layer([&calls](Request &req, const http::Next &next) {
        ++calls;
        return next(req);
    });
    router.route_layer([&calls](Request &req, const http::Next &next) {
        ++calls;
        return next(req);
    });

    EXPECT_EQ(send(router, Method::GET).status, 200);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(router.operations().at(Method::GET).responses.size(), 3u);
}

TEST_F(ApiMethodRouterTest, ReRegistrationReplacesDocumentation) {
    ApiMethodRouter<> router;
    router.get(show_user).get(plain);

    EXPECT_EQ(send(router, Method::GET).body, "plain");
    EXPECT_TRUE(router.operations().at(Method::GET).responses.empty());
}

TEST_F(ApiMethodRouterTest, InferenceDisabledKeepsRequestShapeAndTransforms) {
    ctx.set_infer_responses(false);
    auto router = apidoc::get_with(show_user, [](TransformOperation op) {
        return op.response(401, "unauthorized");
    });

    const Operation &op = router.operations().at(Method::GET);
    EXPECT_EQ(op.responses.status_codes(), (std::vector<uint16_t>{401}));
    EXPECT_NE(op.find_parameter("X-Invalid", "header"), nullptr);
}

TEST_F(ApiMethodRouterTest, InferenceDisabledAppliesToPlainRegistration) {
    ctx.set_infer_responses(false);
    ApiMethodRouter<> router;
    router.get(show_user);

    EXPECT_TRUE(router.operations().at(Method::GET).responses.empty());
}

TEST_F(ApiMethodRouterTest, EveryTopLevelFunctionRegistersItsMethod) {
    EXPECT_TRUE(apidoc::get(plain).router().has(Method::GET));
    EXPECT_TRUE(apidoc::post(plain).router().has(Method::POST));
    EXPECT_TRUE(apidoc::put(plain).router().has(Method::PUT));
    EXPECT_TRUE(apidoc::patch(plain).router().has(Method::PATCH));
    EXPECT_TRUE(apidoc::del(plain).router().has(Method::DEL));
    EXPECT_TRUE(apidoc::head(plain).router().has(Method::HEAD));
    EXPECT_TRUE(apidoc::options(plain).router().has(Method::OPTIONS));
    EXPECT_TRUE(apidoc::trace(plain).router().has(Method::TRACE));

    auto traced = apidoc::trace_with(plain, [](TransformOperation op) { return op.id("traceIt"); });
    EXPECT_EQ(traced.operations().at(Method::TRACE).operation_id, "traceIt");

    auto generic = apidoc::on(Method::OPTIONS, plain);
    EXPECT_EQ(generic.operations().count(Method::OPTIONS), 1u);
}

TEST_F(ApiMethodRouterTest, ChainedNamedMethodsFillTheirSlots) {
    auto router = apidoc::del(plain);
    router.patch_with(plain, [](TransformOperation op) { return op.summary("patch"); })
          .options(plain)
          .head_with(plain, [](TransformOperation op) { return op.deprecated(); });

    PathItem item = router.take_path_item();
    EXPECT_EQ(item.size(), 4u);
    EXPECT_EQ(item.get(Method::PATCH)->summary, "patch");
    EXPECT_TRUE(item.get(Method::HEAD)->deprecated);
    EXPECT_NE(item.get(Method::DEL), nullptr);
    EXPECT_NE(item.get(Method::OPTIONS), nullptr);
}

TEST_F(ApiMethodRouterTest, UnknownMethodRejected) {
    ApiMethodRouter<> router;
    EXPECT_THROW(router.on(static_cast<Method>(8), plain), std::invalid_argument);
    EXPECT_TRUE(router.operations().empty());
    EXPECT_TRUE(router.router().empty());
}

TEST_F(ApiMethodRouterTest, DispatchRunsExtractor) {
    auto router = apidoc::get(show_user);
    Request req(Method::GET, "/users/1");
    req.set_header("X-Invalid", "yes");

    EXPECT_EQ(router.call(req).status, 422);
}

TEST(ApiMethodRouterScopeTest, RegistrationOutsideScopeStoresNothing) {
    ApiMethodRouter<> router;
    EXPECT_THROW(router.get(plain), std::logic_error);
    EXPECT_TRUE(router.operations().empty());
    EXPECT_FALSE(router.router().has(Method::GET));
}

namespace {

struct Db {
    std::string name;
};

http::Response db_name(NoInput, const Db &db) {
    return http::Response::text(200, db.name);
}

class CustomInput : public IOperationInput {
public:
    void operation_input(GenContext &, Operation &op) const override { op.description = "hand written"; }
};

class CustomOutput : public IOperationOutput {
public:
    InferredResponses inferred_responses(GenContext &, Operation &) const override {
        return {{OutcomeKey::status(202), described("accepted")}};
    }
};

} // anonymous namespace

TEST_F(ApiMethodRouterTest, WithStateCarriesDocumentation) {
    auto stateful = apidoc::get<Db>(db_name);
    ApiMethodRouter<> bound = stateful.with_state(Db{"main"});

    EXPECT_EQ(send(bound, Method::GET).body, "main");
    EXPECT_EQ(bound.operations().count(Method::GET), 1u);
}

TEST_F(ApiMethodRouterTest, HandWrittenOperationHandler) {
    OperationHandler<> handler([](Request &, const NoState &) { return http::Response(202); },
                               std::make_shared<CustomInput>(), std::make_shared<CustomOutput>());
    auto router = apidoc::post(handler);

    const Operation &op = router.operations().at(Method::POST);
    EXPECT_EQ(op.description, "hand written");
    EXPECT_TRUE(op.responses.contains(OutcomeKey::status(202)));
    EXPECT_EQ(send(router, Method::POST).status, 202);
}

TEST(OperationHandlerTest, NullPartsRejected) {
    EXPECT_THROW(OperationHandler<>(nullptr, std::make_shared<CustomInput>(), std::make_shared<CustomOutput>()),
                 std::invalid_argument);
    EXPECT_THROW(OperationHandler<>([](Request &, const NoState &) { return http::Response(200); },
                                    nullptr, std::make_shared<CustomOutput>()),
                 std::invalid_argument);
}
