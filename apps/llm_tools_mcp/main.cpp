/// llm-tools-mcp: exposes a command-line tool as an MCP server over stdio.
/// Usage: llm-tools-mcp --config config/llm-clarification.json [options]

#include <llmtools/llmtools.hpp>
#include <argparse/argparse.hpp>

#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t end = s.find(',', start);
        if (end == std::string::npos) end = s.size();
        if (end > start) out.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

// SIGINT/SIGTERM are blocked in every thread and consumed here, so the
// shutdown path runs in ordinary thread context. Must be destroyed before
// the server it stops.
class SignalThread {
public:
    SignalThread(llmtools::McpServer& server, sigset_t set)
        : thread_([this, &server, set] {
              int sig = 0;
              if (sigwait(&set, &sig) != 0 || exiting_) return;
              llmtools::logger()->info("received signal {}, shutting down", sig);
              server.shutdown();
          }) {}

    ~SignalThread() {
        // Wake a still-blocked sigwait with one of the signals it waits for
        exiting_ = true;
        int rc = pthread_kill(thread_.native_handle(), SIGTERM);
        if (rc != 0 && rc != ESRCH) {
            llmtools::logger()->warn("could not wake signal thread: {}", std::strerror(rc));
        }
        thread_.join();
    }

    SignalThread(const SignalThread&) = delete;
    SignalThread& operator=(const SignalThread&) = delete;

private:
    std::atomic<bool> exiting_{false};
    std::thread thread_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("llm-tools-mcp", std::string(llmtools::LIBRARY_VERSION));
    program.add_description("Serve the subcommands of a CLI as MCP tools over stdio.");

    program.add_argument("-c", "--config")
        .help("Path to the bridge JSON config")
        .required();
    program.add_argument("--binary")
        .help("Override the CLI binary named in the config");
    program.add_argument("--timeout")
        .help("Per-call timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--allowed-dirs")
        .help("Comma-separated directories passed as repeated --allowed-dirs");
    program.add_argument("--log-level")
        .help("trace, debug, info, warn, error, critical or off");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << program;
        return 2;
    }

    // Command line wins over the environment
    std::string level = "warn";
    if (const char* env = std::getenv("LLMTOOLS_LOG_LEVEL")) level = env;
    if (auto val = program.present("--log-level")) level = *val;
    if (!llmtools::set_log_level(level)) {
        llmtools::logger()->warn("unknown log level '{}', using info", level);
    }

    llmtools::BridgeConfig config;
    try {
        config = llmtools::load_bridge_config(program.get<std::string>("--config"));
        if (auto val = program.present("--binary")) config.binary = *val;
        if (auto val = program.present<int>("--timeout")) {
            if (*val <= 0) throw llmtools::McpError("--timeout must be positive");
            config.timeout = std::chrono::seconds(*val);
        }
        if (auto val = program.present("--allowed-dirs")) {
            auto& dirs = config.repeated_args["--allowed-dirs"];
            for (auto& d : split_list(*val)) dirs.push_back(std::move(d));
        }
    } catch (const llmtools::McpError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    try {
        config.binary = llmtools::resolve_binary(config.binary, config.fallback_dirs);
    } catch (const llmtools::McpError& e) {
        std::cerr << "ERROR: " << e.what() << "\n"
                  << "Please ensure the binary is installed and accessible.\n";
        return 1;
    }

    // A client that disconnects mid-write must surface as EPIPE, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    llmtools::McpServer::Options opts;
    opts.server_info = config.server_info;
    opts.instructions = config.instructions;
    llmtools::McpServer server{std::move(opts)};

    std::size_t count = llmtools::register_command_tools(server, config);
    SignalThread signal_thread{server, stop_signals};

    // Always shown, regardless of log level
    std::cerr << config.server_info.name << " v" << config.server_info.version
              << " started with " << count << " tools\n";

    try {
        server.serve_stdio();
    } catch (const llmtools::McpError& e) {
        llmtools::logger()->error("server stopped: {}", e.what());
        return 1;
    }
    return 0;
}
