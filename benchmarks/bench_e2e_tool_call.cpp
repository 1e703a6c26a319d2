#include <benchmark/benchmark.h>
#include "simplemcp/framer.hpp"
#include "simplemcp/server.hpp"
#include "simplemcp/transport/stdio_transport.hpp"
#include <unistd.h>
#include <stdexcept>
#include <thread>

using namespace simplemcp;

// A server on one end of a pipe pair and a minimal line-based client on the other
struct E2EFixture {
    int c2s[2], s2c[2];  // client->server and server->client pipes
    std::unique_ptr<McpServer> server;
    std::unique_ptr<StdioTransport> client;
    Framer reader;
    std::thread server_thread;
    int64_t next_id = 1;

    explicit E2EFixture(int extra_tools = 0) {
        if (pipe(c2s) < 0 || pipe(s2c) < 0) throw std::runtime_error("pipe failed");

        ServerBuilder builder("bench-server");
        builder.tool("echo", "Echo", [](const nlohmann::json& args) {
            return text_content(args.value("text", ""));
        });
        for (int i = 0; i < extra_tools; ++i) {
            builder.tool("tool_" + std::to_string(i), "Filler tool",
                         [](const nlohmann::json&) { return nlohmann::json::array(); });
        }
        server = builder.build();

        auto server_transport = std::make_unique<StdioTransport>(c2s[0], s2c[1]);
        server_thread = std::thread([this, t = std::move(server_transport)]() mutable {
            server->serve(std::move(t));
        });
        client = std::make_unique<StdioTransport>(s2c[0], c2s[1]);

        call("initialize", {{"protocolVersion", "2025-06-18"}});
        client->write_chunk(R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n");
    }

    ~E2EFixture() {
        // Dropping the client closes the server's input, which ends serve()
        client.reset();
        if (server_thread.joinable()) server_thread.join();
    }

    nlohmann::json call(const std::string& method, nlohmann::json params) {
        JsonRpcRequest req;
        req.id = RequestId{next_id++};
        req.method = method;
        req.params = std::move(params);
        client->write_chunk(reader.encode(req));
        while (true) {
            if (auto v = reader.next()) return *v;
            auto chunk = client->read_chunk();
            if (!chunk) throw std::runtime_error("server closed the connection");
            reader.feed(*chunk);
        }
    }
};

static void BM_ToolCallStdio(benchmark::State& state) {
    E2EFixture fixture;
    const nlohmann::json params = {{"name", "echo"}, {"arguments", {{"text", "hello benchmark"}}}};

    for (auto _ : state) {
        auto result = fixture.call("tools/call", params);
        benchmark::DoNotOptimize(result);
    }
    state.SetLabel("stdio tools/call roundtrip");
}
BENCHMARK(BM_ToolCallStdio)->MinTime(2.0)->UseRealTime();

static void BM_ListToolsStdio(benchmark::State& state) {
    E2EFixture fixture(99);

    for (auto _ : state) {
        auto result = fixture.call("tools/list", nlohmann::json::object());
        benchmark::DoNotOptimize(result);
    }
    state.SetLabel("tools/list roundtrip");
}
BENCHMARK(BM_ListToolsStdio)->MinTime(2.0)->UseRealTime();

static void BM_PingStdio(benchmark::State& state) {
    E2EFixture fixture;

    for (auto _ : state) {
        auto result = fixture.call("ping", nlohmann::json::object());
        benchmark::DoNotOptimize(result);
    }
    state.SetLabel("ping roundtrip");
}
BENCHMARK(BM_PingStdio)->MinTime(2.0)->UseRealTime();
