#include <gtest/gtest.h>
#include "llmtools/server.hpp"
#include "llmtools/bridge/command_bridge.hpp"
#include "llmtools/transport/stdio_transport.hpp"
#include <poll.h>
#include <unistd.h>
#include <chrono>
#include <string>
#include <thread>

using namespace llmtools;
using namespace std::chrono_literals;

// Client end of a server running on its own thread over two pipes.
class ServerHarness {
public:
    explicit ServerHarness(McpServer& server) : server_(server) {
        if (pipe(c2s_) < 0 || pipe(s2c_) < 0) throw std::runtime_error("pipe failed");
        thread_ = std::thread([this] {
            server_.serve(std::make_unique<StdioTransport>(c2s_[0], s2c_[1]));
        });
    }

    ~ServerHarness() {
        close_input();
        if (thread_.joinable()) thread_.join();
        close(s2c_[0]);
    }

    void send(const std::string& data) {
        ASSERT_EQ(::write(c2s_[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void send_framed(const std::string& body) {
        send("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
    }

    /// Next response line, or nullopt if none arrives within timeout.
    std::optional<nlohmann::json> receive(std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto nl = pending_.find('\n');
            if (nl != std::string::npos) {
                std::string line = pending_.substr(0, nl);
                pending_.erase(0, nl + 1);
                return nlohmann::json::parse(line);
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return std::nullopt;

            struct pollfd pfd{s2c_[0], POLLIN, 0};
            if (poll(&pfd, 1, static_cast<int>(left.count())) <= 0) return std::nullopt;
            char buf[4096];
            ssize_t n = ::read(s2c_[0], buf, sizeof(buf));
            if (n <= 0) return std::nullopt;
            pending_.append(buf, static_cast<std::size_t>(n));
        }
    }

    void close_input() {
        if (c2s_[1] >= 0) {
            close(c2s_[1]);
            c2s_[1] = -1;
        }
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

private:
    McpServer& server_;
    int c2s_[2];
    int s2c_[2];
    std::string pending_;
    std::thread thread_;
};

namespace {

std::string req(const nlohmann::json& id, const std::string& method,
                const nlohmann::json& params = nullptr) {
    nlohmann::json j = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) j["params"] = params;
    return j.dump();
}

BridgeConfig sh_bridge() {
    BridgeConfig cfg;
    cfg.server_info = {"lifecycle-server", "1.0"};
    cfg.instructions = "integration";
    cfg.binary = "/bin/sh";
    cfg.timeout = 5s;
    cfg.append_args = {"--min"};

    CommandToolSpec greet;
    greet.name = "greet";
    greet.description = "Say hello";
    greet.command = {"-c", "echo \"hello $1\" \"$2\"", "sh"};
    greet.arguments.push_back(ArgumentSpec{"name", "", "", ArgumentKind::String, {}, true, std::nullopt, "Who"});
    cfg.tools.push_back(greet);

    CommandToolSpec broken;
    broken.name = "broken";
    broken.command = {"-c", "exit 9", "sh"};
    cfg.tools.push_back(broken);
    return cfg;
}

} // anonymous namespace

TEST(StdioLifecycle, FullLifecycle) {
    auto cfg = sh_bridge();
    McpServer server{McpServer::Options{cfg.server_info, cfg.instructions}};
    register_command_tools(server, cfg);
    ServerHarness h(server);

    h.send(req(1, "initialize", {{"protocolVersion", "2024-11-05"},
                                 {"capabilities", nlohmann::json::object()},
                                 {"clientInfo", {{"name", "it"}, {"version", "1"}}}}) + "\n");
    auto init = h.receive();
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ((*init)["id"], 1);
    EXPECT_EQ((*init)["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ((*init)["result"]["serverInfo"]["name"], "lifecycle-server");
    EXPECT_EQ((*init)["result"]["instructions"], "integration");

    h.send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    h.send_framed(req("list", "tools/list"));
    auto list = h.receive();
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ((*list)["id"], "list");
    EXPECT_EQ((*list)["result"]["tools"].size(), 2u);
    EXPECT_EQ(server.state(), SessionState::Ready);

    h.send(req(2, "tools/call", {{"name", "greet"}, {"arguments", {{"name", "world"}}}}));
    auto greet = h.receive();
    ASSERT_TRUE(greet.has_value());
    EXPECT_FALSE((*greet)["result"].contains("isError"));
    EXPECT_EQ((*greet)["result"]["content"][0]["text"], "hello world --min\n");

    h.send(req(3, "tools/call", {{"name", "greet"}, {"arguments", nlohmann::json::object()}}));
    auto missing = h.receive();
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ((*missing)["result"]["isError"], true);
    EXPECT_EQ((*missing)["result"]["content"][0]["text"], "Error: missing required argument 'name'");

    h.send(req(4, "tools/call", {{"name", "broken"}}));
    auto broken = h.receive();
    ASSERT_TRUE(broken.has_value());
    EXPECT_EQ((*broken)["result"]["content"][0]["text"], "Error: command failed with exit code 9");

    h.send(req(5, "tools/call", {{"name", "absent"}}));
    auto absent = h.receive();
    ASSERT_TRUE(absent.has_value());
    EXPECT_EQ((*absent)["result"]["content"][0]["text"], "Tool not found: absent");

    h.send(req(6, "resources/list"));
    auto unknown = h.receive();
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ((*unknown)["error"]["code"], -32601);

    // End of input ends the loop
    h.close_input();
    h.join();
    EXPECT_FALSE(server.is_running());
}

TEST(StdioLifecycle, NotificationsProduceNoOutput) {
    McpServer server{McpServer::Options{{"quiet", "1.0"}, std::nullopt}};
    ServerHarness h(server);

    h.send(R"({"jsonrpc":"2.0","method":"initialized"})");
    h.send(R"({"jsonrpc":"2.0","method":"tools/list"})");
    h.send(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":1}})");
    EXPECT_FALSE(h.receive(200ms).has_value());

    h.send(req(1, "ping"));
    auto pong = h.receive();
    ASSERT_TRUE(pong.has_value());
    EXPECT_EQ((*pong)["id"], 1);
}

TEST(StdioLifecycle, ShutdownWhileIdle) {
    McpServer server{McpServer::Options{{"idle", "1.0"}, std::nullopt}};
    ServerHarness h(server);

    h.send(req(1, "ping"));
    ASSERT_TRUE(h.receive().has_value());

    server.shutdown();
    h.join();
    EXPECT_FALSE(server.is_running());
}

TEST(StdioLifecycle, ShutdownDuringToolCallStillAnswers) {
    McpServer server{McpServer::Options{{"busy", "1.0"}, std::nullopt}};
    ToolDefinition slow;
    slow.name = "slow";
    server.add_tool(slow, [](const nlohmann::json&) {
        std::this_thread::sleep_for(300ms);
        return std::string("done");
    });
    ServerHarness h(server);

    h.send(req(1, "tools/call", {{"name", "slow"}}));
    std::this_thread::sleep_for(100ms);
    server.shutdown();

    auto resp = h.receive();
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["result"]["content"][0]["text"], "done");
    h.join();
    EXPECT_FALSE(server.is_running());
}
