#include <bsplink/client/build_client.h>
#include <bsplink/client/client_config.h>
#include <bsplink/client/connection_registry.h>
#include <bsplink/client/run_sync.h>
#include <bsplink/core/types.h>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using bsplink::Error;
using bsplink::ErrorCategory;
using bsplink::Result;
using bsplink::client::BuildClient;
using bsplink::ipc::BuildTargetIdentifier;

constexpr int kExitCompileFailed = 2;

int exit_code_for(const Error& error) {
    switch (bsplink::errorCategory(error.code)) {
        case ErrorCategory::Transport:
            return 3;
        case ErrorCategory::Launcher:
            return 4;
        case ErrorCategory::Protocol:
            return 5;
        case ErrorCategory::Request:
            return 6;
        case ErrorCategory::Cache:
            return 7;
        default:
            return 1;
    }
}

int report(const Error& error) {
    std::cerr << "error: " << bsplink::errorKindName(error.code) << ": " << error.message
              << std::endl;
    return exit_code_for(error);
}

const char* severity_label(bsplink::ipc::DiagnosticSeverity severity) {
    switch (severity) {
        case bsplink::ipc::DiagnosticSeverity::Error:
            return "error";
        case bsplink::ipc::DiagnosticSeverity::Warning:
            return "warning";
        case bsplink::ipc::DiagnosticSeverity::Information:
            return "info";
        case bsplink::ipc::DiagnosticSeverity::Hint:
            return "hint";
    }
    return "info";
}

struct CliState {
    std::string configPath;
    std::string endpoint;
    std::string serverBinary;
    std::string workspace;
    std::string logLevel = "warn";
    bool restart = false;
    bool noAutostart = false;
    bool json = false;
    int timeoutMs = 0;
};

class Session {
public:
    explicit Session(const CliState& cli) {
        config_ = bsplink::client::ClientConfig::load(cli.configPath);
        if (!cli.endpoint.empty()) {
            config_.endpoint = cli.endpoint;
        }
        if (!cli.serverBinary.empty()) {
            config_.serverBinary = cli.serverBinary;
        }
        if (!cli.workspace.empty()) {
            config_.workspace = cli.workspace;
        }
        if (config_.workspace.empty()) {
            config_.workspace = std::filesystem::current_path();
        }
        if (cli.noAutostart) {
            config_.autoStart = false;
        }
        if (cli.timeoutMs > 0) {
            config_.requestTimeout = std::chrono::milliseconds(cli.timeoutMs);
        }
        restart_ = cli.restart;

        bsplink::client::BuildClientOptions options;
        options.clientName = config_.clientName;
        options.clientVersion = config_.clientVersion;
        options.workspace = config_.workspace;
        options.languageIds = config_.languageIds;
        options.requestTimeout = config_.requestTimeout;
        options.decodeThreads = config_.decodeThreads;
        options.cache.maxDecodedBytes = config_.maxDecodedBytes;
        registry_ = std::make_unique<bsplink::client::ConnectionRegistry>(options);
    }

    Result<std::shared_ptr<BuildClient>> connect(bool allowSpawn = true) {
        auto launcher = config_.launcher_options();
        if (!launcher) {
            return launcher.error();
        }
        auto options = std::move(launcher).value();
        if (!allowSpawn) {
            options.autoStart = false;
        }
        return registry_->acquire(options, restart_);
    }

    std::chrono::milliseconds timeout() const {
        return config_.requestTimeout + std::chrono::seconds(1);
    }

    // Accepts target URIs or display names
    Result<std::vector<BuildTargetIdentifier>> resolve(BuildClient& client,
                                                       const std::vector<std::string>& names) {
        auto listed = bsplink::client::run_sync(client.listBuildTargets(), timeout());
        if (!listed) {
            return listed.error();
        }
        std::vector<BuildTargetIdentifier> ids;
        for (const auto& name : names) {
            bool found = false;
            for (const auto& target : listed.value()) {
                if (target.id.uri == name || target.displayName == name) {
                    ids.push_back(target.id);
                    found = true;
                    break;
                }
            }
            if (!found) {
                return Error{bsplink::ErrorCode::UnknownTarget,
                             "no build target named '" + name + "'"};
            }
        }
        return ids;
    }

private:
    bsplink::client::ClientConfig config_;
    std::unique_ptr<bsplink::client::ConnectionRegistry> registry_;
    bool restart_{false};
};

int run_targets(Session& session, const CliState& cli) {
    auto client = session.connect();
    if (!client) {
        return report(client.error());
    }
    auto listed = bsplink::client::run_sync(client.value()->listBuildTargets(), session.timeout());
    if (!listed) {
        return report(listed.error());
    }
    if (cli.json) {
        std::cout << nlohmann::json(listed.value()).dump(2) << std::endl;
        return 0;
    }
    for (const auto& target : listed.value()) {
        std::cout << target.displayName.value_or(target.id.uri) << "\t" << target.id.uri;
        for (const auto& dep : target.dependencies) {
            std::cout << "\n  depends on " << dep.uri;
        }
        std::cout << std::endl;
    }
    return 0;
}

template <typename Item, typename Fetch>
int run_per_target(Session& session, const CliState& cli, const std::vector<std::string>& names,
                   Fetch fetch, void (*print)(const Item&)) {
    auto client = session.connect();
    if (!client) {
        return report(client.error());
    }
    auto ids = session.resolve(*client.value(), names);
    if (!ids) {
        return report(ids.error());
    }
    for (const auto& id : ids.value()) {
        Result<Item> item = bsplink::client::run_sync(fetch(*client.value(), id), session.timeout());
        if (!item) {
            return report(item.error());
        }
        if (cli.json) {
            std::cout << nlohmann::json(item.value()).dump(2) << std::endl;
        } else {
            print(item.value());
        }
    }
    return 0;
}

void print_options(const bsplink::ipc::ScalacOptionsItem& item) {
    std::cout << item.target.uri << "\n  classes: " << item.classDirectory << std::endl;
    for (const auto& option : item.options) {
        std::cout << "  option: " << option << std::endl;
    }
    for (const auto& entry : item.classpath) {
        std::cout << "  classpath: " << entry << std::endl;
    }
}

void print_sources(const bsplink::ipc::SourcesItem& item) {
    std::cout << item.target.uri << std::endl;
    for (const auto& source : item.sources) {
        std::cout << "  " << source.uri
                  << (source.kind == bsplink::ipc::SourceItemKind::Directory ? "/" : "")
                  << (source.generated ? " (generated)" : "") << std::endl;
    }
}

void print_dependency_sources(const bsplink::ipc::DependencySourcesItem& item) {
    std::cout << item.target.uri << std::endl;
    for (const auto& source : item.sources) {
        std::cout << "  " << source << std::endl;
    }
}

int run_compile(Session& session, const CliState& cli, const std::vector<std::string>& names,
                const std::string& originId) {
    auto connected = session.connect();
    if (!connected) {
        return report(connected.error());
    }
    auto client = connected.value();
    auto ids = session.resolve(*client, names);
    if (!ids) {
        return report(ids.error());
    }

    // Compiles are unbounded by the request timeout unless one is given explicitly
    auto budget = cli.timeoutMs > 0 ? std::chrono::milliseconds(cli.timeoutMs)
                                    : std::chrono::milliseconds(std::chrono::hours(24));
    auto compiled = bsplink::client::run_sync(client->compile(ids.value(), originId), budget);
    if (!compiled) {
        return report(compiled.error());
    }
    const auto& result = compiled.value();
    auto origin = result.originId.value_or(originId);

    bool failed = result.statusCode != bsplink::ipc::StatusCode::Ok;
    nlohmann::json summary = nlohmann::json::array();
    for (const auto& target : client->cache()->targets(origin)) {
        auto outcome = client->cache()->outcome(origin, target);
        if (!outcome) {
            continue;
        }
        if (cli.json) {
            summary.push_back({{"target", target.uri},
                               {"status", bsplink::ipc::to_string(outcome->status)},
                               {"errors", outcome->errors},
                               {"warnings", outcome->warnings},
                               {"noOp", outcome->noOp}});
            continue;
        }
        std::cout << target.uri << ": " << bsplink::ipc::to_string(outcome->status) << " ("
                  << outcome->errors << " errors, " << outcome->warnings << " warnings"
                  << (outcome->noOp ? ", no-op" : "") << ")" << std::endl;
        for (const auto& entry : outcome->diagnostics) {
            const auto& d = entry.diagnostic;
            std::cout << "  " << entry.uri << ":" << d.range.start.line + 1 << ":"
                      << d.range.start.character + 1 << ": "
                      << severity_label(d.severity.value_or(bsplink::ipc::DiagnosticSeverity::Error))
                      << ": " << d.message << std::endl;
        }
        if (outcome->analysisLocation) {
            std::cout << "  analysis: " << outcome->analysisLocation->string() << std::endl;
        }
    }
    if (cli.json) {
        std::cout << nlohmann::json{{"originId", origin},
                                    {"status", bsplink::ipc::to_string(result.statusCode)},
                                    {"targets", summary}}
                         .dump(2)
                  << std::endl;
    } else {
        std::cout << "compile " << origin << ": " << bsplink::ipc::to_string(result.statusCode)
                  << std::endl;
    }
    return failed ? kExitCompileFailed : 0;
}

int run_shutdown(Session& session) {
    // Never start a server only to stop it
    auto client = session.connect(false);
    if (!client) {
        if (client.error().code == bsplink::ErrorCode::ConnectionRefused) {
            std::cout << "no build server running" << std::endl;
            return 0;
        }
        return report(client.error());
    }
    auto stopped = bsplink::client::run_sync(client.value()->shutdown(), session.timeout());
    if (!stopped) {
        return report(stopped.error());
    }
    std::cout << "build server shut down" << std::endl;
    return 0;
}

void configure_logging(const std::string& level) {
    auto logger = spdlog::stderr_color_mt("bsplink");
    spdlog::set_default_logger(logger);
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::warn;
    }
    spdlog::set_level(parsed);
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"bsplink - build server protocol client", "bsplink"};
    app.require_subcommand(1);

    CliState cli;
    if (const char* envLevel = std::getenv("BSPLINK_LOG_LEVEL")) {
        cli.logLevel = envLevel;
    }
    app.add_option("--config", cli.configPath, "Configuration file path");
    app.add_option("--endpoint", cli.endpoint, "Build server endpoint");
    app.add_option("--server-bin", cli.serverBinary, "Build server executable");
    app.add_option("--workspace", cli.workspace, "Workspace root (default: current directory)");
    app.add_option("--log-level", cli.logLevel, "Log level (trace/debug/info/warn/error)");
    app.add_option("--timeout", cli.timeoutMs, "Request timeout in milliseconds");
    app.add_flag("--restart", cli.restart, "Start a fresh build server first");
    app.add_flag("--no-autostart", cli.noAutostart, "Never spawn a build server");
    app.add_flag("--json", cli.json, "Print results as JSON");

    std::vector<std::string> targetNames;
    std::string originId;

    auto* targetsCmd = app.add_subcommand("targets", "List build targets");
    auto* optionsCmd = app.add_subcommand("options", "Show compiler options of targets");
    optionsCmd->add_option("targets", targetNames, "Target names or URIs")->required();
    auto* sourcesCmd = app.add_subcommand("sources", "Show sources of targets");
    sourcesCmd->add_option("targets", targetNames, "Target names or URIs")->required();
    auto* depSourcesCmd =
        app.add_subcommand("dependency-sources", "Show dependency source archives of targets");
    depSourcesCmd->add_option("targets", targetNames, "Target names or URIs")->required();
    auto* compileCmd = app.add_subcommand("compile", "Compile targets");
    compileCmd->add_option("targets", targetNames, "Target names or URIs")->required();
    compileCmd->add_option("--origin-id", originId, "originId tagging this compile");
    auto* shutdownCmd = app.add_subcommand("shutdown", "Shut the build server down");

    CLI11_PARSE(app, argc, argv);

    configure_logging(cli.logLevel);

    // Writes to a build server that died must fail with EPIPE, not kill the client
    std::signal(SIGPIPE, SIG_IGN);

    try {
        Session session(cli);
        if (targetsCmd->parsed()) {
            return run_targets(session, cli);
        }
        if (optionsCmd->parsed()) {
            return run_per_target<bsplink::ipc::ScalacOptionsItem>(
                session, cli, targetNames,
                [](BuildClient& client, BuildTargetIdentifier id) {
                    return client.getCompilerOptions(std::move(id));
                },
                &print_options);
        }
        if (sourcesCmd->parsed()) {
            return run_per_target<bsplink::ipc::SourcesItem>(
                session, cli, targetNames,
                [](BuildClient& client, BuildTargetIdentifier id) {
                    return client.getSources(std::move(id));
                },
                &print_sources);
        }
        if (depSourcesCmd->parsed()) {
            return run_per_target<bsplink::ipc::DependencySourcesItem>(
                session, cli, targetNames,
                [](BuildClient& client, BuildTargetIdentifier id) {
                    return client.getDependencySources(std::move(id));
                },
                &print_dependency_sources);
        }
        if (compileCmd->parsed()) {
            return run_compile(session, cli, targetNames, originId);
        }
        if (shutdownCmd->parsed()) {
            return run_shutdown(session);
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
