#include <benchmark/benchmark.h>
#include "simplemcp/codec.hpp"
#include "simplemcp/framer.hpp"
#include <string>

using namespace simplemcp;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get_weather","arguments":{"location":"Warsaw","units":"celsius"}}})";

// tools/list response with N tools
static std::string make_large_response(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}}},
                    {"param2", {{"type", "integer"}}}
                }},
                {"required", {"param1"}}
            }}
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}}.dump();
}

static const std::string kLargeResponse = make_large_response(100);

static void BM_ParseSmallMessage(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
}
BENCHMARK(BM_ParseSmallMessage)->MinTime(1.0);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
}
BENCHMARK(BM_ParseToolCall)->MinTime(1.0);

static void BM_ParseLargeResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * kLargeResponse.size()));
}
BENCHMARK(BM_ParseLargeResponse)->MinTime(1.0);

// Framer throughput for a stream delivered in fixed-size chunks
static void BM_FramerNewlineStream(benchmark::State& state) {
    const std::size_t chunk = static_cast<std::size_t>(state.range(0));
    std::string stream;
    for (int i = 0; i < 256; ++i) stream += kToolCallRequest + "\n";

    for (auto _ : state) {
        Framer framer;
        std::size_t count = 0;
        for (std::size_t off = 0; off < stream.size(); off += chunk) {
            framer.feed(std::string_view(stream).substr(off, chunk));
            while (auto v = framer.next()) {
                benchmark::DoNotOptimize(v);
                ++count;
            }
        }
        benchmark::DoNotOptimize(count);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * stream.size()));
}
BENCHMARK(BM_FramerNewlineStream)->Arg(64)->Arg(4096)->MinTime(1.0);

static void BM_FramerContentLengthStream(benchmark::State& state) {
    Framer encoder(FramingMode::ContentLength);
    auto msg = Codec::parse(kToolCallRequest);
    std::string stream;
    for (int i = 0; i < 256; ++i) stream += encoder.encode(msg);

    for (auto _ : state) {
        Framer framer(FramingMode::ContentLength);
        framer.feed(stream);
        while (auto v = framer.next()) {
            benchmark::DoNotOptimize(v);
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * stream.size()));
}
BENCHMARK(BM_FramerContentLengthStream)->MinTime(1.0);

static void BM_EncodeLargeResponse(benchmark::State& state) {
    Framer framer;
    auto msg = Codec::parse(kLargeResponse);
    for (auto _ : state) {
        auto unit = framer.encode(msg);
        benchmark::DoNotOptimize(unit);
    }
}
BENCHMARK(BM_EncodeLargeResponse)->MinTime(1.0);
