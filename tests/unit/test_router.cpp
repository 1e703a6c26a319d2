#include <gtest/gtest.h>
#include "simplemcp/router.hpp"
#include "simplemcp/error.hpp"
#include <stdexcept>

using namespace simplemcp;

namespace {

JsonRpcRequest make_req(const std::string& method, nlohmann::json params = nlohmann::json::object()) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = method;
    req.params = std::move(params);
    return req;
}

} // anonymous namespace

TEST(Router, DispatchRequest) {
    Router router;
    router.on_request("test/method", [](const nlohmann::json& params) -> HandlerResult {
        return nlohmann::json{{"echo", params.value("msg", "")}};
    });

    auto resp = router.dispatch(make_req("test/method", {{"msg", "hello"}}));
    EXPECT_EQ(std::get<int64_t>(resp.id), 1);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_FALSE(resp.error.has_value());
    EXPECT_EQ((*resp.result)["echo"], "hello");
}

TEST(Router, MissingParamsDefaultToEmptyObject) {
    Router router;
    router.on_request("m", [](const nlohmann::json& params) -> HandlerResult {
        return nlohmann::json{{"object", params.is_object()}, {"size", params.size()}};
    });
    JsonRpcRequest req;
    req.id = RequestId{std::string("s")};
    req.method = "m";
    auto resp = router.dispatch(req);
    EXPECT_EQ((*resp.result)["object"], true);
    EXPECT_EQ((*resp.result)["size"], 0);
}

TEST(Router, MethodNotFound) {
    Router router;
    auto resp = router.dispatch(make_req("nonexistent"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_EQ(std::get<int64_t>(resp.id), 1);
}

TEST(Router, HandlerReturnsError) {
    Router router;
    router.on_request("err", [](const nlohmann::json&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "bad", nlohmann::json{{"field", "x"}}};
    });
    auto resp = router.dispatch(make_req("err"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ((*resp.error->data)["field"], "x");
}

TEST(Router, ProtocolErrorKeepsCode) {
    Router router;
    router.on_request("m", [](const nlohmann::json&) -> HandlerResult {
        throw NotFoundError("Unknown tool: x");
    });
    auto resp = router.dispatch(make_req("m"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::NotFound);
    EXPECT_EQ(resp.error->message, "Unknown tool: x");
}

TEST(Router, JsonAccessErrorIsInvalidParams) {
    Router router;
    router.on_request("m", [](const nlohmann::json& params) -> HandlerResult {
        return nlohmann::json(params.at("required_key").get<std::string>());
    });
    auto resp = router.dispatch(make_req("m"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
}

TEST(Router, UnexpectedExceptionIsHandlerFailure) {
    Router router;
    router.on_request("boom", [](const nlohmann::json&) -> HandlerResult {
        throw std::runtime_error("disk on fire");
    });
    auto resp = router.dispatch(make_req("boom"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::HandlerFailure);
    EXPECT_EQ(resp.error->message, "disk on fire");

    router.set_redact_errors(true);
    resp = router.dispatch(make_req("boom"));
    EXPECT_EQ(resp.error->code, error::HandlerFailure);
    EXPECT_EQ(resp.error->message.find("disk"), std::string::npos);
}

TEST(Router, DispatchNotification) {
    Router router;
    int calls = 0;
    router.on_notification("notifications/test", [&calls](const nlohmann::json& params) {
        calls += params.value("n", 0);
    });
    router.dispatch(JsonRpcNotification{"notifications/test", nlohmann::json{{"n", 2}}});
    EXPECT_EQ(calls, 2);
}

TEST(Router, NotificationFallsBackToRequestHandler) {
    Router router;
    int calls = 0;
    router.on_request("tools/call", [&calls](const nlohmann::json&) -> HandlerResult {
        ++calls;
        return nlohmann::json::object();
    });
    router.dispatch(JsonRpcNotification{"tools/call", std::nullopt});
    EXPECT_EQ(calls, 1);
}

TEST(Router, NotificationErrorsAreSwallowed) {
    Router router;
    router.on_notification("n", [](const nlohmann::json&) { throw std::runtime_error("x"); });
    router.on_request("r", [](const nlohmann::json&) -> HandlerResult { throw std::runtime_error("y"); });
    EXPECT_NO_THROW(router.dispatch(JsonRpcNotification{"n", std::nullopt}));
    EXPECT_NO_THROW(router.dispatch(JsonRpcNotification{"r", std::nullopt}));
    EXPECT_NO_THROW(router.dispatch(JsonRpcNotification{"unknown", std::nullopt}));
}

TEST(Router, NonStandardExceptionsAreContained) {
    Router router;
    router.on_notification("n", [](const nlohmann::json&) { throw 42; });
    router.on_request("r", [](const nlohmann::json&) -> HandlerResult { throw "raw string"; });

    EXPECT_NO_THROW(router.dispatch(JsonRpcNotification{"n", std::nullopt}));
    EXPECT_NO_THROW(router.dispatch(JsonRpcNotification{"r", std::nullopt}));

    auto resp = router.dispatch(make_req("r"));
    EXPECT_EQ(std::get<int64_t>(resp.id), 1);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::HandlerFailure);
}

TEST(Router, HasHandler) {
    Router router;
    router.on_request("a", [](const nlohmann::json&) -> HandlerResult { return nlohmann::json{}; });
    router.on_notification("b", [](const nlohmann::json&) {});
    EXPECT_TRUE(router.has_handler("a"));
    EXPECT_TRUE(router.has_handler("b"));
    EXPECT_FALSE(router.has_handler("c"));
}

TEST(ErrorFromException, InvalidArgumentIsInvalidParams) {
    auto err = error_from_exception(std::invalid_argument("nope"));
    EXPECT_EQ(err.code, error::InvalidParams);
}
