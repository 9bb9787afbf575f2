#include <gtest/gtest.h>
#include "../apidoc.h"

#include <memory>
#include <string>

using namespace qb::apidoc;
namespace apidoc = qb::apidoc;
using qb::apidoc::http::Request;
using qb::apidoc::openapi::Operation;

namespace {

struct User {
    int id = 0;
    std::string name;

    static qb::json json_schema() {
        return {
            {"type", "object"},
            {"properties", {{"id", {{"type", "integer"}}}, {"name", {{"type", "string"}}}}},
            {"required", {"id", "name"}}
        };
    }
};

void to_json(qb::json &j, const User &u) {
    j = {{"id", u.id}, {"name", u.name}};
}

void from_json(const qb::json &j, User &u) {
    j.at("id").get_to(u.id);
    j.at("name").get_to(u.name);
}

struct UserId {
    int id = 0;

    static qb::json json_schema() {
        return {
            {"type", "object"},
            {"properties", {{"id", {{"type", "integer"}, {"description", "User identifier"}}}}},
            {"required", {"id"}}
        };
    }
};

void from_json(const qb::json &j, UserId &p) {
    j.at("id").get_to(p.id);
}

struct Paging {
    int page = 0;
    std::string filter;

    static qb::json json_schema() {
        return {
            {"type", "object"},
            {"properties", {{"page", {{"type", "integer"}}}, {"filter", {{"type", "string"}}}}},
            {"required", {"page"}}
        };
    }
};

void from_json(const qb::json &j, Paging &p) {
    j.at("page").get_to(p.page);
    p.filter = j.value("filter", "");
}

JsonResponse<User> create_user(Json<User> body) {
    return {body.value};
}

Text echo_page(Query<Paging> q) {
    return {std::to_string(q.value.page) + ":" + q.value.filter};
}

Either<JsonResponse<User>, NoContent> find_user(Path<UserId> path) {
    if (path.value.id == 0) {
        return NoContent{};
    }
    return JsonResponse<User>{User{path.value.id, "found"}};
}

Text update_user(Inputs<Path<UserId>, Json<User>> in) {
    return {std::to_string(in.get<0>().value.id) + "=" + in.get<1>().value.name};
}

Request json_request(Method m, std::string body) {
    Request req(m, "/users", std::move(body));
    req.set_header("Content-Type", "application/json");
    return req;
}

} // anonymous namespace

class AdaptersTest : public ::testing::Test {
protected:
    GenContext ctx;
    std::unique_ptr<GenScope> scope;

    void SetUp() override { scope = std::make_unique<GenScope>(ctx); }
    void TearDown() override { scope.reset(); }
};

TEST_F(AdaptersTest, JsonBodyDocumented) {
    auto router = apidoc::post(create_user);
    const Operation &op = router.operations().at(Method::POST);

    ASSERT_TRUE(op.request_body.has_value());
    EXPECT_EQ((*op.request_body)["required"], true);
    EXPECT_EQ((*op.request_body)["content"]["application/json"]["schema"], User::json_schema());
    EXPECT_EQ(op.responses.status_codes(), (std::vector<uint16_t>{200}));
    EXPECT_EQ((*op.responses.find(OutcomeKey::status(200))).content["application/json"]["schema"],
              User::json_schema());
}

TEST_F(AdaptersTest, JsonErrorResponsesOnlyWhenRequested) {
    ctx.set_all_error_responses(true);
    auto router = apidoc::post(create_user);

    EXPECT_EQ(router.operations().at(Method::POST).responses.status_codes(),
              (std::vector<uint16_t>{200, 400, 415, 422}));
    EXPECT_TRUE(ctx.errors().empty());
}

TEST_F(AdaptersTest, JsonDispatch) {
    auto router = apidoc::post(create_user);

    Request ok = json_request(Method::POST, R"({"id": 7, "name": "ada"})");
    http::Response res = router.call(ok);
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.header("Content-Type"), "application/json");
    EXPECT_EQ(qb::json::parse(res.body)["name"], "ada");

    Request no_type(Method::POST, "/users", R"({"id": 7, "name": "ada"})");
    EXPECT_EQ(router.call(no_type).status, 415);

    Request malformed = json_request(Method::POST, "{not json");
    EXPECT_EQ(router.call(malformed).status, 400);

    Request wrong_shape = json_request(Method::POST, R"({"id": "seven"})");
    EXPECT_EQ(router.call(wrong_shape).status, 422);
}

TEST_F(AdaptersTest, QueryParametersDocumentedAndExtracted) {
    auto router = apidoc::get(echo_page);
    const Operation &op = router.operations().at(Method::GET);

    ASSERT_NE(op.find_parameter("page", "query"), nullptr);
    ASSERT_NE(op.find_parameter("filter", "query"), nullptr);
    EXPECT_EQ((*op.find_parameter("page", "query"))["required"], true);
    EXPECT_EQ((*op.find_parameter("filter", "query"))["required"], false);
    EXPECT_EQ((*op.find_parameter("page", "query"))["schema"]["type"], "integer");

    Request req(Method::GET, "/users");
    req.query["page"] = "3";
    req.query["filter"] = "active";
    http::Response res = router.call(req);
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "3:active");

    Request bad(Method::GET, "/users");
    bad.query["page"] = "three";
    EXPECT_EQ(router.call(bad).status, 400);

    Request missing(Method::GET, "/users");
    EXPECT_EQ(router.call(missing).status, 400);
}

TEST_F(AdaptersTest, PathParametersAlwaysRequired) {
    auto router = apidoc::get(find_user);
    const Operation &op = router.operations().at(Method::GET);

    const qb::json *id = op.find_parameter("id", "path");
    ASSERT_NE(id, nullptr);
    EXPECT_EQ((*id)["required"], true);
    EXPECT_EQ((*id)["description"], "User identifier");
}

TEST_F(AdaptersTest, EitherDocumentsBothSides) {
    auto router = apidoc::get(find_user);
    const Operation &op = router.operations().at(Method::GET);
    EXPECT_EQ(op.responses.status_codes(), (std::vector<uint16_t>{200, 204}));

    Request found(Method::GET, "/users/5");
    found.params["id"] = "5";
    http::Response res = router.call(found);
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(qb::json::parse(res.body)["id"], 5);

    Request empty(Method::GET, "/users/0");
    empty.params["id"] = "0";
    EXPECT_EQ(router.call(empty).status, 204);
}

TEST_F(AdaptersTest, EitherWithOverlappingSidesConflicts) {
    auto router = apidoc::get([]() -> Either<Text, JsonResponse<User>> { return Text{"x"}; });

    ASSERT_EQ(ctx.errors().size(), 1u);
    EXPECT_EQ(ctx.errors()[0].kind, ErrorKind::InferredResponseConflict);
    EXPECT_EQ(router.operations().at(Method::GET).responses.find(OutcomeKey::status(200))->description,
              "plain text");
}

TEST_F(AdaptersTest, InputsComposeInOrder) {
    ctx.set_all_error_responses(true);
    auto router = apidoc::put(update_user);
    const Operation &op = router.operations().at(Method::PUT);

    EXPECT_NE(op.find_parameter("id", "path"), nullptr);
    EXPECT_TRUE(op.request_body.has_value());
    // Path and Json both claim an early 400; the second one is a conflict.
    ASSERT_EQ(ctx.errors().size(), 1u);
    EXPECT_EQ(ctx.errors()[0].status, 400);
    EXPECT_EQ(op.responses.find(OutcomeKey::status(400))->description, "Invalid path parameters");

    Request req = json_request(Method::PUT, R"({"id": 1, "name": "grace"})");
    req.params["id"] = "9";
    EXPECT_EQ(router.call(req).body, "9=grace");

    Request bad_path = json_request(Method::PUT, R"({"id": 1, "name": "grace"})");
    bad_path.params["id"] = "nine";
    EXPECT_EQ(router.call(bad_path).status, 400);

    Request bad_body(Method::PUT, "/users/9", "{}");
    bad_body.params["id"] = "9";
    EXPECT_EQ(router.call(bad_body).status, 415);
}

TEST_F(AdaptersTest, NoContentAndText) {
    auto router = apidoc::del([]() { return NoContent{}; });
    router.get([]() { return Text{"hello"}; });

    const auto &ops = router.operations();
    EXPECT_TRUE(ops.at(Method::DEL).responses.contains(OutcomeKey::status(204)));
    EXPECT_EQ(ops.at(Method::GET).responses.find(OutcomeKey::status(200))->content.count("text/plain; charset=utf-8"), 1u);

    Request get_req(Method::GET, "/");
    EXPECT_EQ(router.call(get_req).body, "hello");
    Request del_req(Method::DEL, "/");
    EXPECT_EQ(router.call(del_req).status, 204);
}

TEST_F(AdaptersTest, TransformAppliesAdaptersExplicitly) {
    auto router = apidoc::post_with(
        []() { return http::Response(201); },
        [](TransformOperation op) {
            return op.input<Json<User>>().output<JsonResponse<User>>().response(201, "created", User::json_schema());
        });

    const Operation &op = router.operations().at(Method::POST);
    EXPECT_TRUE(op.request_body.has_value());
    EXPECT_EQ(op.responses.status_codes(), (std::vector<uint16_t>{200, 201}));
}

TEST_F(AdaptersTest, TransformEdits) {
    auto tagged = [](TransformOperation op) { return op.tag("users").tag("admin"); };
    auto router = apidoc::get_with(find_user, [&](TransformOperation op) {
        return op.summary("Find a user")
            .description("Looks a user up by id")
            .id("findUser")
            .security_requirement("bearerAuth")
            .security_requirement("oauth", {"read:users"})
            .default_response(openapi::Response("unexpected error"))
            .parameter(openapi::make_parameter("id", "path", {{"type", "string"}}))
            .parameter(openapi::make_parameter("verbose", "query", {{"type", "boolean"}}))
            .with(tagged);
    });

    const Operation &op = router.operations().at(Method::GET);
    EXPECT_EQ(op.summary, "Find a user");
    EXPECT_EQ(op.description, "Looks a user up by id");
    EXPECT_EQ(op.operation_id, "findUser");
    EXPECT_EQ(op.tags, (std::vector<std::string>{"users", "admin"}));
    ASSERT_EQ(op.security.size(), 2u);
    EXPECT_TRUE(op.security[0]["bearerAuth"].empty());
    EXPECT_EQ(op.security[1]["oauth"][0], "read:users");
    EXPECT_TRUE(op.responses.has_default());
    EXPECT_NE(op.find_parameter("verbose", "query"), nullptr);

    // the path id was already declared by Path<UserId>
    ASSERT_EQ(ctx.errors().size(), 1u);
    EXPECT_EQ(ctx.errors()[0].kind, ErrorKind::DuplicateParameter);
}

TEST_F(AdaptersTest, DuplicateRequestBodyReported) {
    auto router = apidoc::post_with(create_user, [](TransformOperation op) { return op.input<Json<User>>(); });

    ASSERT_EQ(ctx.errors().size(), 1u);
    EXPECT_EQ(ctx.errors()[0].kind, ErrorKind::DuplicateRequestBody);
    EXPECT_TRUE(router.operations().at(Method::POST).request_body.has_value());
}
