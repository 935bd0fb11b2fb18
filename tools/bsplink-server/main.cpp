#include <bsplink/client/launcher.h>
#include <bsplink/ipc/endpoint.h>
#include <bsplink/server/compile_engine.h>
#include <bsplink/server/socket_server.h>
#include <bsplink/server/workspace.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void configure_logging(const std::string& logFile, const std::string& level) {
    try {
        std::shared_ptr<spdlog::logger> logger;
        if (!logFile.empty()) {
            std::filesystem::path path(logFile);
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            logger = spdlog::basic_logger_mt("bsplink-server", logFile);
        } else {
            // stdout may carry the protocol; logs always go to stderr
            logger = spdlog::stderr_color_mt("bsplink-server");
        }
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::info);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "bsplink-server: cannot set up logging: %s\n", e.what());
    }

    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"bsplink build server"};

    std::string endpointText;
    std::string workspace = std::filesystem::current_path().string();
    std::string protocolVersion{bsplink::ipc::kServerProtocolToken};
    std::string logFile;
    std::string logLevel = "info";
    std::size_t workers = 4;
    std::size_t compileWorkers = 2;
    int idleTimeoutMs = 0;
    bool stdio = false;
    bool persist = false;

    if (const char* envLevel = std::getenv("BSPLINK_LOG_LEVEL")) {
        logLevel = envLevel;
    }

    app.add_option("--endpoint", endpointText,
                   "Endpoint to serve (tcp://host:port, local:///path, pipe://r,w)");
    app.add_flag("--stdio", stdio, "Serve a single session over stdin/stdout");
    app.add_flag("--persist", persist,
                 "Keep serving after the last client sends build/shutdown and build/exit");
    app.add_option("--workspace", workspace, "Workspace root");
    app.add_option("--protocol-version", protocolVersion,
                   "Launcher protocol token this server must speak");
    app.add_option("--log-file", logFile, "Log file path (default: stderr)");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)");
    app.add_option("--workers", workers, "Request worker threads")->check(CLI::PositiveNumber);
    app.add_option("--compile-workers", compileWorkers, "Threads running compiles")
        ->check(CLI::PositiveNumber);
    app.add_option("--idle-timeout", idleTimeoutMs,
                   "Stop after this many ms without sessions (0 = never)")
        ->check(CLI::NonNegativeNumber);

    CLI11_PARSE(app, argc, argv);

    configure_logging(logFile, logLevel);

    if (protocolVersion != bsplink::ipc::kServerProtocolToken) {
        spdlog::error("Unsupported launcher protocol '{}' (this server speaks {})",
                      protocolVersion, bsplink::ipc::kServerProtocolToken);
        return 2;
    }
    if (stdio == !endpointText.empty()) {
        spdlog::error("Exactly one of --endpoint and --stdio is required");
        return 2;
    }

    bsplink::server::ServerConfig config;
    if (stdio) {
        config.endpoint = bsplink::ipc::PipeEndpoint{0, 1, {}, {}};
    } else {
        auto parsed = bsplink::ipc::parse_endpoint(endpointText);
        if (!parsed) {
            spdlog::error("Invalid endpoint '{}': {}", endpointText, parsed.error().message);
            return 2;
        }
        config.endpoint = std::move(parsed).value();
    }

    std::error_code ec;
    config.workspace = std::filesystem::absolute(workspace, ec);
    if (ec) {
        config.workspace = workspace;
    }
    config.protocolVersion = protocolVersion;
    config.workerThreads = workers;
    config.compileThreads = compileWorkers;
    config.idleShutdown = std::chrono::milliseconds(idleTimeoutMs);
    config.handleSignals = true;
    config.exitAfterShutdown = !persist;

    // Writes to a vanished client must fail with EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    try {
        auto workspaceState = std::make_shared<bsplink::server::Workspace>(config.workspace);
        auto engine = std::make_shared<bsplink::server::ManifestCompileEngine>();
        bsplink::server::SocketServer server(config, workspaceState, engine);

        auto started = server.start();
        if (!started) {
            spdlog::error("Failed to start build server: {}", started.error().message);
            return 1;
        }

        // stdout belongs to the protocol in stdio mode
        auto ready = bsplink::client::format_ready_line(server.endpoint(), protocolVersion);
        std::FILE* readyOut = stdio ? stderr : stdout;
        std::fprintf(readyOut, "%s\n", ready.c_str());
        std::fflush(readyOut);

        server.wait();
        server.stop();

        if (stdio) {
            return server.lastSessionClean() ? 0 : 1;
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Build server error: {}", e.what());
        return 1;
    }
}
