#include <benchmark/benchmark.h>
#include "llmtools/transport/stdio_transport.hpp"
#include "llmtools/server.hpp"
#include <unistd.h>
#include <string>
#include <thread>

using namespace llmtools;

static std::string make_ping_request(int id, bool framed) {
    std::string body = R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"ping"})";
    if (!framed) return body + "\n";
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

// N pings through a full server over pipes; arg 1 selects header framing
static void BM_StdioThroughput(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    const bool framed = state.range(1) != 0;

    std::string input;
    for (int i = 1; i <= n; ++i) input += make_ping_request(i, framed);

    for (auto _ : state) {
        int c2s[2], s2c[2];
        if (pipe(c2s) < 0 || pipe(s2c) < 0) {
            state.SkipWithError("pipe failed");
            return;
        }

        McpServer::Options opts;
        opts.server_info = {"bench-server", "1.0"};
        McpServer server{opts};

        std::thread server_thread([&] {
            server.serve(std::make_unique<StdioTransport>(c2s[0], s2c[1]));
        });
        std::thread writer([&] {
            const char* p = input.data();
            std::size_t left = input.size();
            while (left > 0) {
                ssize_t w = ::write(c2s[1], p, left);
                if (w <= 0) break;
                p += w;
                left -= static_cast<std::size_t>(w);
            }
            close(c2s[1]);
        });

        // Drain responses until the server closes its end
        std::size_t lines = 0;
        char buf[8192];
        ssize_t r;
        while ((r = ::read(s2c[0], buf, sizeof(buf))) > 0) {
            for (ssize_t i = 0; i < r; ++i) lines += buf[i] == '\n';
        }

        writer.join();
        server_thread.join();
        close(s2c[0]);
        benchmark::DoNotOptimize(lines);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(BM_StdioThroughput)->Args({1000, 0})->Args({1000, 1})->MinTime(2.0);
