#include <bsplink/core/format.h>
#include <bsplink/server/build_server_session.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <unordered_set>

namespace bsplink::server {

using ipc::json;
namespace methods = ipc::methods;

namespace {

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

template <typename T> Result<T> decode_params(const json& params, std::string_view method) {
    auto decoded = ipc::decode_as<T>(params);
    if (!decoded) {
        return Error{ErrorCode::InvalidArgument,
                     bsplink::format("invalid params for {}: {}", method, decoded.error().message)};
    }
    return decoded;
}

std::string_view major_of(std::string_view version) {
    return version.substr(0, version.find('.'));
}

} // namespace

const char* to_string(BuildServerSession::State state) noexcept {
    switch (state) {
        case BuildServerSession::State::AwaitingInitialize:
            return "awaiting-initialize";
        case BuildServerSession::State::Running:
            return "running";
        case BuildServerSession::State::ShuttingDown:
            return "shutting-down";
        case BuildServerSession::State::Exited:
            return "exited";
    }
    return "unknown";
}

std::shared_ptr<BuildServerSession>
BuildServerSession::create(std::shared_ptr<ipc::Connection> connection,
                           std::shared_ptr<Workspace> workspace,
                           std::shared_ptr<ICompileEngine> engine,
                           SessionExecutors executors, ServerSessionOptions options) {
    return std::shared_ptr<BuildServerSession>(
        new BuildServerSession(std::move(connection), std::move(workspace), std::move(engine),
                               std::move(executors), std::move(options)));
}

BuildServerSession::BuildServerSession(std::shared_ptr<ipc::Connection> connection,
                                       std::shared_ptr<Workspace> workspace,
                                       std::shared_ptr<ICompileEngine> engine,
                                       SessionExecutors executors,
                                       ServerSessionOptions options)
    : connection_(std::move(connection)), workspace_(std::move(workspace)),
      engine_(std::move(engine)), options_(std::move(options)),
      peer_(ipc::JsonRpcPeer::create(connection_, executors.requests)) {
    if (executors.compiles) {
        peer_->route(std::string(methods::kCompile), std::move(executors.compiles));
    }
}

BuildServerSession::~BuildServerSession() {
    if (subscription_ != 0) {
        workspace_->unsubscribe(subscription_);
    }
}

void BuildServerSession::start(std::function<void(const Error&)> onClosed) {
    onClosed_ = std::move(onClosed);
    std::weak_ptr<BuildServerSession> weak = weak_from_this();

    peer_->set_request_handler(
        [weak](const ipc::RequestContext& ctx, const json& params) -> Result<json> {
            auto self = weak.lock();
            if (!self) {
                return Error{ErrorCode::ConnectionLost, "session closed"};
            }
            return self->dispatch(ctx, params);
        });
    peer_->set_notification_handler([weak](const std::string& method, const json&) {
        if (auto self = weak.lock()) {
            self->on_notification(method);
        }
    });
    peer_->set_close_handler([weak](const Error& reason) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        self->state_.store(State::Exited, std::memory_order_release);
        std::call_once(self->closedOnce_, [&self, &reason]() {
            spdlog::debug("Session {} closed: {}", self->describe(), reason.message);
            if (self->onClosed_) {
                self->onClosed_(reason);
            }
        });
    });
    subscription_ = workspace_->subscribe([weak](const std::vector<ipc::BuildTargetEvent>& changes) {
        auto self = weak.lock();
        if (self && self->state() == State::Running) {
            self->send(ipc::DidChangeBuildTarget{changes});
        }
    });
    peer_->start();
    spdlog::debug("Session started on {}", describe());
}

void BuildServerSession::close() {
    peer_->close();
}

Result<json> BuildServerSession::dispatch(const ipc::RequestContext& ctx, const json& params) {
    const auto& method = ctx.method;
    if (method == methods::kInitialize) {
        return handle_initialize(params);
    }

    const auto current = state();
    if (current == State::AwaitingInitialize) {
        return Error{ErrorCode::InvalidState,
                     bsplink::format("server not initialized, '{}' rejected", method)};
    }
    if (method == methods::kShutdown) {
        return handle_shutdown();
    }
    if (current != State::Running) {
        return Error{ErrorCode::InvalidState,
                     bsplink::format("server is {}, '{}' rejected", to_string(current), method)};
    }

    if (method == methods::kBuildTargets) {
        return handle_build_targets();
    }
    if (method == methods::kScalacOptions) {
        return handle_scalac_options(params);
    }
    if (method == methods::kSources) {
        return handle_sources(params);
    }
    if (method == methods::kDependencySources) {
        return handle_dependency_sources(params);
    }
    if (method == methods::kCompile) {
        return handle_compile(ctx, params);
    }
    if (method == methods::kReload) {
        return handle_reload();
    }
    return Error{ErrorCode::NotFound, bsplink::format("method not found: {}", method)};
}

void BuildServerSession::on_notification(const std::string& method) {
    if (method == methods::kInitialized) {
        spdlog::debug("Session {}: client initialized", describe());
        return;
    }
    if (method == methods::kExit) {
        spdlog::info("Session {}: exit ({})", describe(),
                     shutdown_requested() ? "after shutdown" : "without shutdown");
        state_.store(State::Exited, std::memory_order_release);
        peer_->close();
        return;
    }
    spdlog::debug("Session {}: ignoring notification '{}'", describe(), method);
}

Result<json> BuildServerSession::handle_initialize(const json& params) {
    if (state() != State::AwaitingInitialize) {
        return Error{ErrorCode::ProtocolError, "build/initialize received twice"};
    }
    auto decoded = decode_params<ipc::InitializeBuildParams>(params, methods::kInitialize);
    if (!decoded) {
        return decoded.error();
    }
    const auto& request = decoded.value();
    if (major_of(request.bspVersion) != major_of(ipc::kBspVersion)) {
        spdlog::warn("Client {} speaks BSP {}, server speaks {}", request.displayName,
                     request.bspVersion, ipc::kBspVersion);
    }
    if (auto root = ipc::uri_to_path(request.rootUri);
        root && root->lexically_normal() != workspace_->root().lexically_normal()) {
        spdlog::warn("Client {} asked for workspace {}, serving {}", request.displayName,
                     root->string(), workspace_->root().string());
    }

    ipc::InitializeBuildResult result;
    result.displayName = options_.serverName;
    result.version = options_.serverVersion;
    result.bspVersion = std::string(ipc::kBspVersion);
    result.capabilities.compileProvider = ipc::CompileProvider{options_.languageIds};
    result.capabilities.dependencySourcesProvider = true;
    result.capabilities.canReload = true;
    result.capabilities.buildTargetChangedProvider = true;

    state_.store(State::Running, std::memory_order_release);
    spdlog::info("Session {}: initialized by {} {}", describe(), request.displayName,
                 request.version);
    return json(result);
}

Result<json> BuildServerSession::handle_build_targets() {
    auto graph = workspace_->graph();
    return json(ipc::WorkspaceBuildTargetsResult{graph->targets()});
}

Result<json> BuildServerSession::handle_scalac_options(const json& params) {
    auto decoded = decode_params<ipc::TargetsParams>(params, methods::kScalacOptions);
    if (!decoded) {
        return decoded.error();
    }
    auto graph = workspace_->graph();
    ipc::ScalacOptionsResult result;
    for (const auto& target : decoded.value().targets) {
        auto item = graph->compilerOptions(target);
        if (!item) {
            return item.error();
        }
        result.items.push_back(std::move(item).value());
    }
    return json(result);
}

Result<json> BuildServerSession::handle_sources(const json& params) {
    auto decoded = decode_params<ipc::TargetsParams>(params, methods::kSources);
    if (!decoded) {
        return decoded.error();
    }
    auto graph = workspace_->graph();
    ipc::SourcesResult result;
    for (const auto& target : decoded.value().targets) {
        auto item = graph->sources(target);
        if (!item) {
            return item.error();
        }
        result.items.push_back(std::move(item).value());
    }
    return json(result);
}

Result<json> BuildServerSession::handle_dependency_sources(const json& params) {
    auto decoded = decode_params<ipc::TargetsParams>(params, methods::kDependencySources);
    if (!decoded) {
        return decoded.error();
    }
    auto graph = workspace_->graph();
    ipc::DependencySourcesResult result;
    for (const auto& target : decoded.value().targets) {
        auto item = graph->dependencySources(target);
        if (!item) {
            return item.error();
        }
        result.items.push_back(std::move(item).value());
    }
    return json(result);
}

Result<json> BuildServerSession::handle_compile(const ipc::RequestContext& ctx,
                                                const json& params) {
    auto decoded = decode_params<ipc::CompileParams>(params, methods::kCompile);
    if (!decoded) {
        return decoded.error();
    }
    const auto& request = decoded.value();
    if (request.targets.empty()) {
        return Error{ErrorCode::InvalidArgument, "compile request names no targets"};
    }

    // One snapshot for the whole request; a concurrent reload does not affect it
    auto graph = workspace_->graph();
    auto order = graph->compileOrder(request.targets);
    if (!order) {
        return order.error();
    }

    const auto serial = compileCounter_.fetch_add(1, std::memory_order_relaxed) + 1;
    const auto originId = request.originId.value_or(bsplink::format("compile-{}", serial));
    spdlog::info("Session {}: compile '{}' of {} target(s)", describe(), originId,
                 order.value().size());

    std::unordered_set<std::string> failed;
    auto overall = ipc::StatusCode::Ok;
    std::size_t index = 0;
    for (const auto& id : order.value()) {
        const auto taskId = bsplink::format("{}-{}", originId, index++);
        if (ctx.is_cancelled() || state() == State::Exited) {
            overall = ipc::StatusCode::Cancelled;
            break;
        }

        const auto* target = graph->target(id);
        std::string blockedBy;
        for (const auto& dep : target->dependencies) {
            if (failed.contains(dep.uri)) {
                blockedBy = dep.uri;
                break;
            }
        }
        if (!blockedBy.empty()) {
            finish_skipped(id, originId, taskId,
                           bsplink::format("Skipped {}: dependency {} failed",
                                           target->displayName.value_or(id.uri), blockedBy));
            failed.insert(id.uri);
            continue;
        }

        auto status = compile_target(*graph, id, originId, taskId, ctx);
        if (status == ipc::StatusCode::Cancelled) {
            failed.insert(id.uri);
            overall = ipc::StatusCode::Cancelled;
            break;
        }
        if (status != ipc::StatusCode::Ok) {
            failed.insert(id.uri);
            overall = ipc::StatusCode::Error;
        }
    }

    ipc::CompileResult result;
    result.originId = originId;
    result.statusCode = overall;
    spdlog::info("Session {}: compile '{}' finished: {}", describe(), originId,
                 ipc::to_string(overall));
    return json(result);
}

ipc::StatusCode BuildServerSession::compile_target(const BuildTargetGraph& graph,
                                                   const ipc::BuildTargetIdentifier& target,
                                                   const std::string& originId,
                                                   const std::string& taskId,
                                                   const ipc::RequestContext& ctx) {
    const auto* project = graph.project(target);
    auto options = graph.compilerOptions(target);
    if (!project || !options) {
        finish_skipped(target, originId, taskId,
                       bsplink::format("Target {} disappeared from the workspace", target.uri));
        return ipc::StatusCode::Error;
    }

    auto lock = workspace_->target_lock(target);
    std::lock_guard<std::mutex> guard(*lock);

    CompileInputs inputs;
    inputs.target = target;
    inputs.name = project->name;
    inputs.sources = project->sources;
    inputs.sources.insert(inputs.sources.end(), project->generatedSources.begin(),
                          project->generatedSources.end());
    inputs.classpath = options.value().classpath;
    inputs.options = project->scalacOptions;
    inputs.classesDir = project->classesDir;
    inputs.analysisOut = workspace_->analysis_path(project->name, originId);
    inputs.cancelled = [&ctx]() { return ctx.is_cancelled(); };

    ipc::TaskStartParams start;
    start.taskId.id = taskId;
    start.originId = originId;
    start.eventTime = now_millis();
    start.message = bsplink::format("Compiling {} ({} source(s))", project->name,
                                    inputs.sources.size());
    start.dataKind = std::string(ipc::kCompileTaskKind);
    start.data = json(ipc::CompileTask{target});
    send(start);

    CompileOutput output;
    if (auto compiled = engine_->compile(inputs); compiled) {
        output = std::move(compiled).value();
    } else {
        spdlog::error("Compile engine failed on {}: {}", project->name, compiled.error().message);
        log_to_client(ipc::MessageType::Error,
                      bsplink::format("Compilation of {} could not run: {}", project->name,
                                      compiled.error().message),
                      originId);
        output.status = ipc::StatusCode::Error;
        output.errors = 1;
    }

    // One publishDiagnostics per file, in first-seen order
    std::vector<std::pair<std::filesystem::path, std::vector<ipc::Diagnostic>>> byFile;
    for (auto& d : output.diagnostics) {
        auto it = std::find_if(byFile.begin(), byFile.end(),
                               [&d](const auto& entry) { return entry.first == d.file; });
        if (it == byFile.end()) {
            byFile.emplace_back(d.file, std::vector<ipc::Diagnostic>{});
            it = std::prev(byFile.end());
        }
        it->second.push_back(std::move(d.diagnostic));
    }
    for (auto& [file, diagnostics] : byFile) {
        ipc::PublishDiagnosticsParams publish;
        publish.textDocument = ipc::path_to_uri(file);
        publish.buildTarget = target;
        publish.originId = originId;
        publish.diagnostics = std::move(diagnostics);
        publish.reset = true;
        send(publish);
    }

    ipc::CompileReport report;
    report.target = target;
    report.originId = originId;
    report.errors = output.errors;
    report.warnings = output.warnings;
    report.time = output.elapsed.count();
    report.noOp = output.noOp;
    if (output.analysis) {
        report.analysisOut = ipc::path_to_uri(*output.analysis);
    }

    ipc::TaskFinishParams finish;
    finish.taskId.id = taskId;
    finish.originId = originId;
    finish.eventTime = now_millis();
    finish.message = bsplink::format("Compiled {} ({})", project->name,
                                     ipc::to_string(output.status));
    finish.status = output.status;
    finish.dataKind = std::string(ipc::kCompileReportKind);
    finish.data = json(report);
    send(finish);
    return output.status;
}

void BuildServerSession::finish_skipped(const ipc::BuildTargetIdentifier& target,
                                        const std::string& originId, const std::string& taskId,
                                        const std::string& reason) {
    ipc::TaskStartParams start;
    start.taskId.id = taskId;
    start.originId = originId;
    start.eventTime = now_millis();
    start.message = reason;
    start.dataKind = std::string(ipc::kCompileTaskKind);
    start.data = json(ipc::CompileTask{target});
    send(start);

    ipc::CompileReport report;
    report.target = target;
    report.originId = originId;

    ipc::TaskFinishParams finish;
    finish.taskId.id = taskId;
    finish.originId = originId;
    finish.eventTime = now_millis();
    finish.message = reason;
    finish.status = ipc::StatusCode::Cancelled;
    finish.dataKind = std::string(ipc::kCompileReportKind);
    finish.data = json(report);
    send(finish);
}

Result<json> BuildServerSession::handle_reload() {
    auto changes = workspace_->reload();
    log_to_client(ipc::MessageType::Info,
                  bsplink::format("Workspace reloaded: {} target(s), {} change(s)",
                                  workspace_->graph()->size(), changes.size()));
    return json(nullptr);
}

Result<json> BuildServerSession::handle_shutdown() {
    shutdownRequested_.store(true, std::memory_order_release);
    state_.store(State::ShuttingDown, std::memory_order_release);
    spdlog::info("Session {}: shutdown requested", describe());
    return json(nullptr);
}

void BuildServerSession::send(const ipc::BuildNotification& notification) {
    auto [method, params] = ipc::encode_notification(notification);
    if (auto sent = peer_->notify(method, std::move(params)); !sent) {
        spdlog::debug("Session {}: {} not delivered: {}", describe(), method,
                      sent.error().message);
    }
}

void BuildServerSession::log_to_client(ipc::MessageType type, std::string message,
                                       std::optional<std::string> originId) {
    ipc::LogMessageParams log;
    log.type = type;
    log.originId = std::move(originId);
    log.message = std::move(message);
    send(log);
}

} // namespace bsplink::server
