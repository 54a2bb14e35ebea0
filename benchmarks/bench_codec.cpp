#include <benchmark/benchmark.h>
#include "llmtools/codec.hpp"
#include "llmtools/json_rpc.hpp"
#include "llmtools/transport/framing.hpp"
#include <string>
#include <vector>

using namespace llmtools;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"llm_clarify_match","arguments":{"question":"Should the API use snake_case?","entries_file":".planning/clarification-tracking.yaml","timeout":30}}})";

// tools/call carrying a large text argument, as file-writing tools do
static std::string make_large_request(std::size_t text_size) {
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", 7},
        {"method", "tools/call"},
        {"params", {
            {"name", "llm_filesystem_write_file"},
            {"arguments", {{"path", "/srv/a/out.txt"}, {"content", std::string(text_size, 'x')}}}
        }}
    };
    return req.dump();
}

static nlohmann::json make_tools_list(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"param1", {{"type", "string"}, {"description", "First parameter"}}},
                    {"param2", {{"type", "integer"}, {"description", "Second parameter"}}}
                }},
                {"required", {"param1"}}
            }}
        });
    }
    return nlohmann::json{{"tools", tools}};
}

static const std::string kLargeRequest = make_large_request(64 * 1024);

// ---- Parse benchmarks ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kSmallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallRequest)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kToolCallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseLargeRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kLargeRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_ParseLargeRequest)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!}";
    for (auto _ : state) {
        try {
            auto req = Codec::parse_request(bad);
            benchmark::DoNotOptimize(req);
        } catch (const McpProtocolError& e) {
            benchmark::DoNotOptimize(e.code);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Framing ----

static void BM_ScanObjectBoundary(benchmark::State& state) {
    for (auto _ : state) {
        JsonObjectScanner scanner;
        std::size_t end = 0;
        for (std::size_t i = 0; i < kLargeRequest.size(); ++i) {
            if (scanner.feed(kLargeRequest[i])) {
                end = i + 1;
                break;
            }
        }
        benchmark::DoNotOptimize(end);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_ScanObjectBoundary)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeSmallResponse(benchmark::State& state) {
    auto resp = make_result_response(1, nlohmann::json::object());
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeSmallResponse)->MinTime(1.0);

static void BM_SerializeToolsList(benchmark::State& state) {
    auto resp = make_result_response(1, make_tools_list(static_cast<int>(state.range(0))));
    std::size_t bytes = 0;
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        bytes += s.size();
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes));
}
BENCHMARK(BM_SerializeToolsList)->Arg(10)->Arg(100)->MinTime(1.0);

static void BM_RoundTrip(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kToolCallRequest);
        auto out = Codec::serialize(make_result_response(*req.id, req.params->at("arguments")));
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_RoundTrip)->MinTime(1.0);
