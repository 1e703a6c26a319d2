#include <gtest/gtest.h>
#include "server_harness.hpp"
#include "simplemcp/error.hpp"
#include <string>

using namespace simplemcp;

namespace {

std::unique_ptr<McpServer> echo_server(McpServer::Options opts = {}) {
    return ServerBuilder()
        .with_options(std::move(opts))
        .tool("echo", "Echo", [](const nlohmann::json& args) { return args.at("text"); })
        .build();
}

McpServer::Options content_length_options() {
    McpServer::Options opts;
    opts.framing = FramingMode::ContentLength;
    return opts;
}

} // anonymous namespace

TEST(ServerLoop, TruncatedMessageEndsLoopAndClosesTransport) {
    test::ServerHarness harness(echo_server());
    harness.initialize();

    harness.send_raw(R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"ec)");
    harness.close_input();
    harness.join();

    EXPECT_FALSE(harness.server().is_running());
    EXPECT_EQ(harness.server().state(), SessionState::Closed);
    EXPECT_TRUE(harness.output_closed());
}

TEST(ServerLoop, MessagesWithoutJsonrpcMemberAreServed) {
    test::ServerHarness harness(echo_server());

    harness.send_raw("{\"id\":1,\"method\":\"initialize\"}\n");
    auto init = harness.read_message();
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ((*init)["id"], 1);
    EXPECT_TRUE((*init)["result"].contains("serverInfo"));

    harness.send_raw("{\"id\":2,\"method\":\"tools/call\","
                     "\"params\":{\"name\":\"echo\",\"arguments\":{\"text\":\"hi\"}}}\n");
    auto resp = harness.read_message();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], 2);
    EXPECT_FALSE(resp->contains("error"));
    EXPECT_EQ((*resp)["result"]["content"], "hi");
}

TEST(ServerLoop, FinalLineWithoutNewlineIsAnswered) {
    test::ServerHarness harness(echo_server());
    harness.initialize();

    harness.send_raw(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    harness.close_input();

    auto resp = harness.read_message();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], 2);
    EXPECT_TRUE(resp->contains("result"));

    harness.join();
    EXPECT_EQ(harness.server().state(), SessionState::Closed);
}

TEST(ServerLoop, InvalidJsonIsFatal) {
    test::ServerHarness harness(echo_server());
    harness.initialize();

    harness.send_raw("{this is not json}\n");
    harness.join();

    EXPECT_EQ(harness.server().state(), SessionState::Closed);
    EXPECT_TRUE(harness.output_closed());
}

TEST(ServerLoop, OversizedMessageIsFatal) {
    McpServer::Options opts;
    opts.max_message_size = 64;
    test::ServerHarness harness(echo_server(opts));

    harness.send({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                  {"params", {{"name", "echo"}, {"arguments", {{"text", std::string(200, 'x')}}}}}});
    harness.join();
    EXPECT_EQ(harness.server().state(), SessionState::Closed);
}

TEST(ServerLoop, InvalidRequestWithIdIsAnswered) {
    test::ServerHarness harness(echo_server());
    harness.initialize();

    harness.send_raw(R"({"jsonrpc":"1.0","id":11,"method":"ping"})" "\n");
    auto resp = harness.read_message();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], 11);
    EXPECT_EQ((*resp)["error"]["code"], error::InvalidRequest);

    // Not fatal
    auto pong = harness.request(12, "ping");
    EXPECT_EQ(pong["id"], 12);
    EXPECT_TRUE(harness.server().is_running());
}

TEST(ServerLoop, InvalidRequestWithoutIdIsDropped) {
    test::ServerHarness harness(echo_server());
    harness.initialize();

    harness.send_raw("[1,2,3]\n");
    harness.send_raw(R"({"jsonrpc":"2.0","method":42})" "\n");
    auto pong = harness.request(1, "ping");
    EXPECT_EQ(pong["id"], 1);
    EXPECT_TRUE(pong.contains("result"));
}

TEST(ServerLoop, UnknownMethod) {
    test::ServerHarness harness(echo_server());
    harness.initialize();
    auto resp = harness.request(3, "completion/complete");
    EXPECT_EQ(resp["error"]["code"], error::MethodNotFound);
}

TEST(ServerLoop, ResponsesFollowRequestOrder) {
    test::ServerHarness harness(echo_server());
    harness.initialize();

    std::string batch;
    for (int i = 1; i <= 20; ++i) {
        nlohmann::json req = {{"jsonrpc", "2.0"}, {"id", i}, {"method", "tools/call"},
                              {"params", {{"name", "echo"}, {"arguments", {{"text", std::to_string(i)}}}}}};
        batch += req.dump() + "\n";
    }
    // Split at an arbitrary point to exercise partial reads
    harness.send_raw(batch.substr(0, batch.size() / 3));
    harness.send_raw(batch.substr(batch.size() / 3));

    for (int i = 1; i <= 20; ++i) {
        auto resp = harness.read_message();
        ASSERT_TRUE(resp.has_value()) << "missing response " << i;
        EXPECT_EQ((*resp)["id"], i);
        EXPECT_EQ((*resp)["result"]["content"], std::to_string(i));
    }
}

TEST(ServerLoop, CrlfAndBlankLinesTolerated) {
    test::ServerHarness harness(echo_server());
    harness.initialize();
    harness.send_raw("\r\n\n" R"({"jsonrpc":"2.0","id":4,"method":"ping"})" "\r\n");
    auto resp = harness.read_message();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["id"], 4);
}

TEST(ServerLoop, ClientResponsesIgnored) {
    test::ServerHarness harness(echo_server());
    harness.initialize();
    harness.send({{"jsonrpc", "2.0"}, {"id", 77}, {"result", nlohmann::json::object()}});
    auto resp = harness.request(78, "ping");
    EXPECT_EQ(resp["id"], 78);
}

TEST(ServerLoop, ContentLengthFraming) {
    test::ServerHarness harness(echo_server(content_length_options()));
    auto init = harness.initialize();
    EXPECT_TRUE(init.contains("result"));

    auto resp = harness.request(2, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "hi"}}}});
    EXPECT_EQ(resp["id"], 2);
    EXPECT_EQ(resp["result"]["content"], "hi");
}

TEST(ServerLoop, ContentLengthTruncatedBody) {
    test::ServerHarness harness(echo_server(content_length_options()));
    harness.initialize();
    harness.send_raw("Content-Length: 100\r\n\r\n{\"jsonrpc\":\"2.0\"");
    harness.close_input();
    harness.join();
    EXPECT_EQ(harness.server().state(), SessionState::Closed);
    EXPECT_TRUE(harness.output_closed());
}

TEST(ServerLoop, ContentLengthMissingHeaderIsFatal) {
    test::ServerHarness harness(echo_server(content_length_options()));
    harness.initialize();
    harness.send_raw("X-Other: 1\r\n\r\n{}");
    harness.join();
    EXPECT_EQ(harness.server().state(), SessionState::Closed);
}
