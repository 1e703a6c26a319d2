#include <benchmark/benchmark.h>
#include "simplemcp/dispatcher.hpp"
#include "simplemcp/router.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace simplemcp;

// Registry with N tools, all sharing one trivial handler
static Registry make_registry(int n_tools) {
    RegistryBuilder builder;
    for (int i = 0; i < n_tools; ++i) {
        ToolDefinition def;
        def.name = "tool_" + std::to_string(i);
        def.description = "Benchmark tool " + std::to_string(i);
        builder.add_tool(def, [](const nlohmann::json& args) { return args; });
    }
    ToolDefinition echo;
    echo.name = "echo";
    echo.input_schema = nlohmann::json{
        {"type", "object"},
        {"properties", {{"text", {{"type", "string"}}}}},
        {"required", {"text"}}
    };
    builder.add_tool(echo, [](const nlohmann::json& args) { return args.at("text"); });
    return builder.build();
}

static JsonRpcRequest make_request(int64_t id, std::string method, nlohmann::json params) {
    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = std::move(method);
    req.params = std::move(params);
    return req;
}

static std::unique_ptr<Dispatcher> make_dispatcher(const Registry& registry, Session& session,
                                                   std::size_t page_size = 50) {
    Dispatcher::Options opts;
    opts.page_size = page_size;
    auto d = std::make_unique<Dispatcher>(registry, session, opts);
    (void)d->dispatch(make_request(0, "initialize", nlohmann::json::object()));
    return d;
}

static void BM_RouterKnownMethod(benchmark::State& state) {
    Router router;
    router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    auto req = make_request(1, "ping", nlohmann::json::object());

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterKnownMethod)->MinTime(1.0);

static void BM_RouterUnknownMethod(benchmark::State& state) {
    Router router;
    auto req = make_request(1, "not_registered_method", nlohmann::json::object());

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterUnknownMethod)->MinTime(1.0);

static void BM_CallToolWithSchema(benchmark::State& state) {
    Registry registry = make_registry(10);
    Session session({"bench", "1.0"});
    auto d = make_dispatcher(registry, session);
    JsonRpcMessage msg = make_request(1, "tools/call",
                                      {{"name", "echo"}, {"arguments", {{"text", "hello"}}}});

    for (auto _ : state) {
        auto resp = d->dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_CallToolWithSchema)->MinTime(1.0);

static void BM_CallToolLookup(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    Registry registry = make_registry(n);
    Session session({"bench", "1.0"});
    auto d = make_dispatcher(registry, session);

    std::vector<JsonRpcMessage> requests;
    for (int i = 0; i < n; ++i) {
        requests.push_back(make_request(i, "tools/call", {{"name", "tool_" + std::to_string(i)}}));
    }

    std::size_t i = 0;
    for (auto _ : state) {
        auto resp = d->dispatch(requests[i % requests.size()]);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_CallToolLookup)->Arg(10)->Arg(1000)->MinTime(1.0);

static void BM_ListToolsPage(benchmark::State& state) {
    Registry registry = make_registry(1000);
    Session session({"bench", "1.0"});
    auto d = make_dispatcher(registry, session, static_cast<std::size_t>(state.range(0)));
    JsonRpcMessage msg = make_request(1, "tools/list", {{"cursor", "500"}});

    for (auto _ : state) {
        auto resp = d->dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ListToolsPage)->Arg(50)->Arg(0)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    Registry registry = make_registry(1);
    Session session({"bench", "1.0"});
    auto d = make_dispatcher(registry, session);
    JsonRpcMessage msg = JsonRpcNotification{"notifications/initialized", std::nullopt};

    for (auto _ : state) {
        auto resp = d->dispatch(msg);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchNotification)->MinTime(1.0);
