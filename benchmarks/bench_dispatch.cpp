#include <benchmark/benchmark.h>
#include "llmtools/router.hpp"
#include "llmtools/server.hpp"
#include "llmtools/tool_registry.hpp"
#include <memory>
#include <string>

using namespace llmtools;

// Router with N methods registered (unique_ptr: Router holds a mutex)
static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    return router;
}

static std::unique_ptr<McpServer> make_server(int n_tools) {
    McpServer::Options opts;
    opts.server_info = {"bench-server", "1.0"};
    auto server = std::make_unique<McpServer>(std::move(opts));
    for (int i = 0; i < n_tools; ++i) {
        ToolDefinition def;
        def.name = "tool_" + std::to_string(i);
        def.description = "Benchmark tool " + std::to_string(i);
        def.input_schema = {{"type", "object"}, {"properties", {{"text", {{"type", "string"}}}}}};
        server->add_tool(std::move(def), [](const nlohmann::json& args) {
            return args.value("text", std::string());
        });
    }
    return server;
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto router = make_router(1);
    JsonRpcRequest req;
    req.id = 1;
    req.method = "ping";

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);
    JsonRpcRequest req;
    req.id = 1;
    req.method = "not_registered_method";

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    auto router = make_router(100);
    JsonRpcRequest req;
    req.id = 1;
    req.method = "method_50";

    for (auto _ : state) {
        auto resp = router->dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

static void BM_RegistryFind(benchmark::State& state) {
    ToolRegistry registry;
    const int n = static_cast<int>(state.range(0));
    for (int i = 0; i < n; ++i) {
        ToolDefinition def;
        def.name = "tool_" + std::to_string(i);
        registry.add(std::move(def), [](const nlohmann::json&) { return std::string(); });
    }
    const std::string name = "tool_" + std::to_string(n / 2);

    for (auto _ : state) {
        auto handler = registry.find(name);
        benchmark::DoNotOptimize(handler);
    }
}
BENCHMARK(BM_RegistryFind)->Arg(10)->Arg(1000)->MinTime(1.0);

static void BM_ServerToolsCall(benchmark::State& state) {
    auto server = make_server(static_cast<int>(state.range(0)));
    JsonRpcRequest req;
    req.id = 1;
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "tool_0"}, {"arguments", {{"text", "hello"}}}};

    for (auto _ : state) {
        auto resp = server->handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ServerToolsCall)->Arg(1)->Arg(50)->MinTime(1.0);

static void BM_ServerToolsList(benchmark::State& state) {
    auto server = make_server(static_cast<int>(state.range(0)));
    JsonRpcRequest req;
    req.id = 1;
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = server->handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ServerToolsList)->Arg(20)->MinTime(1.0);
