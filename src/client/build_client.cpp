#include <bsplink/client/build_client.h>
#include <bsplink/core/format.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

#include <unistd.h>

namespace bsplink::client {

using boost::asio::awaitable;
using ipc::json;
using PendingRequest = ipc::JsonRpcPeer::PendingRequest;

namespace {

constexpr std::string_view kNoOpCompilePrefix = "Start no-op compilation for";

std::string_view major_of(std::string_view version) {
    return version.substr(0, version.find('.'));
}

void log_by_type(ipc::MessageType type, const std::string& message) {
    switch (type) {
        case ipc::MessageType::Error:
            spdlog::error("{}", message);
            break;
        case ipc::MessageType::Warning:
            spdlog::warn("{}", message);
            break;
        case ipc::MessageType::Info:
        case ipc::MessageType::Log:
            spdlog::info("{}", message);
            break;
    }
}

template <typename T> Result<T> decode_reply(const Result<json>& reply, std::string_view method) {
    if (!reply) {
        return reply.error();
    }
    auto decoded = ipc::decode_as<T>(reply.value());
    if (!decoded) {
        return Error{ErrorCode::ProtocolError,
                     bsplink::format("malformed {} response: {}", method, decoded.error().message)};
    }
    return decoded;
}

} // namespace

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Uninitialized:
            return "uninitialized";
        case SessionState::Initializing:
            return "initializing";
        case SessionState::Active:
            return "active";
        case SessionState::ShuttingDown:
            return "shutting-down";
        case SessionState::Closed:
            return "closed";
    }
    return "unknown";
}

BuildEventHandlers BuildEventHandlers::logging() {
    BuildEventHandlers handlers;
    handlers.onLogMessage = [](const ipc::LogMessageParams& p) { log_by_type(p.type, p.message); };
    handlers.onShowMessage = [](const ipc::ShowMessageParams& p) {
        log_by_type(p.type, p.message);
    };
    handlers.onTaskStart = [](const ipc::TaskStartParams& p) {
        if (p.message && !p.message->starts_with(kNoOpCompilePrefix)) {
            spdlog::info("{}", *p.message);
        }
    };
    handlers.onTaskFinish = [](const ipc::TaskFinishParams& p) {
        if (p.message) {
            spdlog::debug("{} ({})", *p.message, ipc::to_string(p.status));
        }
    };
    handlers.onPublishDiagnostics = [](const ipc::PublishDiagnosticsParams& p) {
        for (const auto& d : p.diagnostics) {
            auto line = bsplink::format("{}:{}:{}: {}", p.textDocument, d.range.start.line + 1,
                                        d.range.start.character + 1, d.message);
            switch (d.severity.value_or(ipc::DiagnosticSeverity::Error)) {
                case ipc::DiagnosticSeverity::Error:
                    spdlog::error("{}", line);
                    break;
                case ipc::DiagnosticSeverity::Warning:
                    spdlog::warn("{}", line);
                    break;
                default:
                    spdlog::info("{}", line);
                    break;
            }
        }
    };
    return handlers;
}

std::shared_ptr<BuildClient> BuildClient::create(std::shared_ptr<ipc::Connection> connection,
                                                 BuildClientOptions options,
                                                 BuildEventHandlers handlers,
                                                 std::shared_ptr<IAnalysisReader> reader) {
    std::shared_ptr<BuildClient> client(new BuildClient(
        std::move(connection), std::move(options), std::move(handlers), std::move(reader)));
    client->start();
    return client;
}

BuildClient::BuildClient(std::shared_ptr<ipc::Connection> connection, BuildClientOptions options,
                         BuildEventHandlers handlers, std::shared_ptr<IAnalysisReader> reader)
    : connection_(std::move(connection)), options_(std::move(options)),
      handlers_(std::move(handlers)),
      decodePool_(std::make_shared<ipc::ThreadPool>("analysis", options_.decodeThreads)),
      decoder_(pooled_decoder(decodePool_, std::move(reader))),
      cache_(std::make_shared<CompileResultCache>(decoder_, options_.cache)),
      peer_(ipc::JsonRpcPeer::create(connection_)) {}

BuildClient::~BuildClient() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_queue_locked(Error{ErrorCode::ConnectionLost, "build client destroyed"});
        state_ = SessionState::Closed;
    }
    peer_->close();
}

void BuildClient::start() {
    std::weak_ptr<BuildClient> weak = weak_from_this();
    peer_->set_notification_handler([weak](const std::string& method, const json& params) {
        if (auto self = weak.lock()) {
            self->on_notification(method, params);
        }
    });
    peer_->set_close_handler([weak](const Error& reason) {
        if (auto self = weak.lock()) {
            self->on_closed(reason);
        }
    });
    peer_->start();
}

std::string BuildClient::next_origin_id() {
    return bsplink::format("bsplink-{}-{}", ::getpid(),
                           originCounter_.fetch_add(1, std::memory_order_relaxed) + 1);
}

void BuildClient::adopt_process(std::unique_ptr<ServerProcess> process) {
    std::lock_guard<std::mutex> lock(mutex_);
    process_ = std::move(process);
}

SessionState BuildClient::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<ipc::InitializeBuildResult> BuildClient::serverInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return serverInfo_;
}

BuildClient::SentFuture BuildClient::submit(std::string method, json params) {
    auto promise = std::make_shared<std::promise<Result<PendingRequest>>>();
    SentFuture sent = promise->get_future().share();

    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case SessionState::Active:
            promise->set_value(peer_->send_request(method, std::move(params)));
            break;
        case SessionState::Uninitialized:
        case SessionState::Initializing:
            spdlog::debug("BuildClient: queueing '{}' until the session is initialized", method);
            queue_.push_back(QueuedCall{std::move(method), std::move(params), promise});
            break;
        case SessionState::ShuttingDown:
            promise->set_value(Error{ErrorCode::InvalidState, "session is shutting down"});
            break;
        case SessionState::Closed:
            promise->set_value(closeReason_.code != ErrorCode::Success
                                   ? closeReason_
                                   : Error{ErrorCode::ConnectionLost, "session closed"});
            break;
    }
    return sent;
}

void BuildClient::flush_queue_locked() {
    while (!queue_.empty()) {
        auto call = std::move(queue_.front());
        queue_.pop_front();
        call.sent->set_value(peer_->send_request(call.method, std::move(call.params)));
    }
}

void BuildClient::fail_queue_locked(const Error& error) {
    while (!queue_.empty()) {
        queue_.front().sent->set_value(error);
        queue_.pop_front();
    }
}

awaitable<Result<PendingRequest>> BuildClient::await_sent(SentFuture sent,
                                                          std::chrono::milliseconds timeout) {
    using namespace std::chrono_literals;
    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

    while (sent.wait_for(0ms) != std::future_status::ready) {
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            co_return Error{ErrorCode::Timeout,
                            bsplink::format("session not initialized within {}ms",
                                            timeout.count())};
        }
        timer.expires_after(10ms);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return sent.get();
}

awaitable<Result<json>> BuildClient::call(std::string method, json params,
                                          std::chrono::milliseconds timeout) {
    auto sent = co_await await_sent(submit(method, std::move(params)), timeout);
    if (!sent) {
        co_return sent.error();
    }
    auto reply = co_await peer_->await_response(std::move(sent).value(), timeout);
    co_return reply;
}

awaitable<Result<ipc::InitializeBuildResult>> BuildClient::initialize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Uninitialized) {
            co_return Error{ErrorCode::InvalidState,
                            bsplink::format("initialize called while {}", to_string(state_))};
        }
        state_ = SessionState::Initializing;
    }

    auto fail = [this](Error error) {
        spdlog::warn("BuildClient: initialization failed: {}", error.message);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = SessionState::Closed;
            closeReason_ = error;
            fail_queue_locked(error);
        }
        connection_->fail(error);
        return error;
    };

    ipc::InitializeBuildParams params;
    params.displayName = options_.clientName;
    params.version = options_.clientVersion;
    params.bspVersion = std::string(ipc::kBspVersion);
    std::error_code ec;
    auto root = options_.workspace.empty() ? std::filesystem::current_path(ec) : options_.workspace;
    params.rootUri = ipc::path_to_uri(std::filesystem::absolute(root, ec));
    params.capabilities.languageIds = options_.languageIds;

    auto reply = co_await peer_->request(std::string(ipc::methods::kInitialize), json(params),
                                         options_.requestTimeout);
    if (!reply) {
        co_return fail(reply.error());
    }

    const json& raw = reply.value();
    if (!raw.is_object() || !raw.contains("bspVersion") || !raw["bspVersion"].is_string() ||
        !raw.contains("capabilities") || !raw["capabilities"].is_object()) {
        co_return fail(Error{ErrorCode::MalformedHandshake,
                             "initialize response lacks bspVersion or capabilities"});
    }
    auto decoded = ipc::decode_as<ipc::InitializeBuildResult>(raw);
    if (!decoded) {
        co_return fail(Error{ErrorCode::MalformedHandshake,
                             bsplink::format("malformed initialize response: {}",
                                             decoded.error().message)});
    }
    auto result = std::move(decoded).value();
    if (major_of(result.bspVersion) != major_of(ipc::kBspVersion)) {
        co_return fail(Error{ErrorCode::VersionIncompatible,
                             bsplink::format("server speaks BSP {}, client speaks {}",
                                             result.bspVersion, ipc::kBspVersion)});
    }

    if (auto sent = peer_->notify(ipc::methods::kInitialized, json::object()); !sent) {
        co_return fail(sent.error());
    }
    connection_->mark_ready();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Initializing) {
            // Connection dropped while we were validating
            co_return closeReason_.code != ErrorCode::Success
                ? closeReason_
                : Error{ErrorCode::ConnectionLost, "session closed during initialization"};
        }
        state_ = SessionState::Active;
        serverInfo_ = result;
        flush_queue_locked();
    }
    spdlog::info("Connected to {} {} (BSP {})", result.displayName, result.version,
                 result.bspVersion);
    co_return result;
}

awaitable<Result<std::vector<ipc::BuildTarget>>> BuildClient::listBuildTargets() {
    auto reply = co_await call(std::string(ipc::methods::kBuildTargets), json::object(),
                               options_.requestTimeout);
    auto decoded = decode_reply<ipc::WorkspaceBuildTargetsResult>(reply, ipc::methods::kBuildTargets);
    if (!decoded) {
        co_return decoded.error();
    }
    co_return std::move(decoded).value().targets;
}

awaitable<Result<ipc::ScalacOptionsItem>>
BuildClient::getCompilerOptions(ipc::BuildTargetIdentifier target) {
    auto reply = co_await call(std::string(ipc::methods::kScalacOptions),
                               json(ipc::TargetsParams{{target}}), options_.requestTimeout);
    auto decoded = decode_reply<ipc::ScalacOptionsResult>(reply, ipc::methods::kScalacOptions);
    if (!decoded) {
        co_return decoded.error();
    }
    for (auto& item : decoded.value().items) {
        if (item.target == target) {
            co_return std::move(item);
        }
    }
    co_return Error{ErrorCode::UnknownTarget, bsplink::format("unknown target {}", target.uri)};
}

awaitable<Result<ipc::SourcesItem>> BuildClient::getSources(ipc::BuildTargetIdentifier target) {
    auto reply = co_await call(std::string(ipc::methods::kSources),
                               json(ipc::TargetsParams{{target}}), options_.requestTimeout);
    auto decoded = decode_reply<ipc::SourcesResult>(reply, ipc::methods::kSources);
    if (!decoded) {
        co_return decoded.error();
    }
    for (auto& item : decoded.value().items) {
        if (item.target == target) {
            co_return std::move(item);
        }
    }
    co_return Error{ErrorCode::UnknownTarget, bsplink::format("unknown target {}", target.uri)};
}

awaitable<Result<ipc::DependencySourcesItem>>
BuildClient::getDependencySources(ipc::BuildTargetIdentifier target) {
    auto reply = co_await call(std::string(ipc::methods::kDependencySources),
                               json(ipc::TargetsParams{{target}}), options_.requestTimeout);
    auto decoded =
        decode_reply<ipc::DependencySourcesResult>(reply, ipc::methods::kDependencySources);
    if (!decoded) {
        co_return decoded.error();
    }
    for (auto& item : decoded.value().items) {
        if (item.target == target) {
            co_return std::move(item);
        }
    }
    co_return Error{ErrorCode::UnknownTarget, bsplink::format("unknown target {}", target.uri)};
}

awaitable<Result<ipc::CompileResult>>
BuildClient::compile(std::vector<ipc::BuildTargetIdentifier> targets, std::string originId) {
    if (targets.empty()) {
        co_return Error{ErrorCode::InvalidArgument, "compile needs at least one target"};
    }
    if (originId.empty()) {
        originId = next_origin_id();
    }
    if (auto begun = cache_->beginRequest(originId); !begun) {
        co_return begun.error();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        compiles_[originId] = 0;
    }
    auto forget = [this, &originId]() {
        std::lock_guard<std::mutex> lock(mutex_);
        compiles_.erase(originId);
    };

    ipc::CompileParams params;
    params.targets = std::move(targets);
    params.originId = originId;
    auto sent = co_await await_sent(submit(std::string(ipc::methods::kCompile), json(params)),
                                    options_.requestTimeout);
    if (!sent) {
        forget();
        cache_->failRequest(originId, sent.error());
        co_return sent.error();
    }
    auto pending = std::move(sent).value();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        compiles_[originId] = pending.id;
    }
    if (!cache_->inFlight(originId)) {
        // cancelCompile() ran while the request was still queued
        if (auto cancelled = peer_->cancel(pending.id); !cancelled) {
            spdlog::debug("BuildClient: cancel for '{}' not sent: {}", originId,
                          cancelled.error().message);
        }
    }

    const auto requestId = pending.id;
    auto reply = co_await peer_->await_response(std::move(pending), options_.compileTimeout);
    forget();
    if (!reply) {
        const auto& error = reply.error();
        if (error.code == ErrorCode::Timeout) {
            if (auto cancelled = peer_->cancel(requestId); !cancelled) {
                spdlog::debug("BuildClient: cancel for '{}' not sent: {}", originId,
                              cancelled.error().message);
            }
        }
        cache_->failRequest(originId, error);
        co_return error;
    }

    auto decoded = decode_reply<ipc::CompileResult>(reply, ipc::methods::kCompile);
    if (!decoded) {
        cache_->failRequest(originId, decoded.error());
        co_return decoded.error();
    }
    auto result = std::move(decoded).value();
    if (result.statusCode == ipc::StatusCode::Cancelled) {
        cache_->cancelRequest(originId);
    } else {
        cache_->completeRequest(originId);
    }
    if (!result.originId) {
        result.originId = originId;
    }
    co_return result;
}

Result<void> BuildClient::cancelCompile(const std::string& originId) {
    int64_t requestId = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = compiles_.find(originId);
        if (it == compiles_.end()) {
            return Error{ErrorCode::NotFound,
                         bsplink::format("no compile in flight with originId '{}'", originId)};
        }
        requestId = it->second;
    }
    cache_->cancelRequest(originId);
    if (requestId > 0) {
        return peer_->cancel(requestId);
    }
    return Result<void>();
}

awaitable<Result<void>> BuildClient::reloadWorkspace() {
    auto reply =
        co_await call(std::string(ipc::methods::kReload), json(nullptr), options_.requestTimeout);
    if (!reply) {
        co_return reply.error();
    }
    co_return Result<void>();
}

awaitable<Result<void>> BuildClient::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closed) {
            co_return Result<void>();
        }
        if (state_ == SessionState::ShuttingDown) {
            co_return Error{ErrorCode::InvalidState, "shutdown already in progress"};
        }
        if (state_ != SessionState::Active) {
            state_ = SessionState::Closed;
            closeReason_ = Error{ErrorCode::ConnectionLost, "closed before initialization"};
            fail_queue_locked(closeReason_);
            peer_->close();
            co_return Result<void>();
        }
        state_ = SessionState::ShuttingDown;
    }

    auto reply = co_await peer_->request(std::string(ipc::methods::kShutdown), json(nullptr),
                                         options_.requestTimeout);
    Result<void> outcome;
    if (reply) {
        outcome = peer_->notify(ipc::methods::kExit);
    } else {
        outcome = reply.error();
    }
    peer_->close();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Closed;
        if (closeReason_.code == ErrorCode::Success) {
            closeReason_ = Error{ErrorCode::ConnectionLost, "session shut down"};
        }
    }
    co_return outcome;
}

void BuildClient::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closed) {
            return;
        }
        state_ = SessionState::Closed;
        closeReason_ = Error{ErrorCode::ConnectionLost, "closed by client"};
        fail_queue_locked(closeReason_);
    }
    peer_->close();
}

void BuildClient::on_notification(const std::string& method, const json& params) {
    auto decoded = ipc::decode_notification(method, params);
    if (!decoded) {
        spdlog::warn("BuildClient: dropping notification: {}", decoded.error().message);
        return;
    }
    std::visit(
        [this](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, ipc::TaskStartParams>) {
                on_task_start(n);
                if (handlers_.onTaskStart)
                    handlers_.onTaskStart(n);
            } else if constexpr (std::is_same_v<T, ipc::TaskProgressParams>) {
                if (handlers_.onTaskProgress)
                    handlers_.onTaskProgress(n);
            } else if constexpr (std::is_same_v<T, ipc::TaskFinishParams>) {
                on_task_finish(n);
                if (handlers_.onTaskFinish)
                    handlers_.onTaskFinish(n);
            } else if constexpr (std::is_same_v<T, ipc::LogMessageParams>) {
                if (handlers_.onLogMessage)
                    handlers_.onLogMessage(n);
            } else if constexpr (std::is_same_v<T, ipc::ShowMessageParams>) {
                if (handlers_.onShowMessage)
                    handlers_.onShowMessage(n);
            } else if constexpr (std::is_same_v<T, ipc::PublishDiagnosticsParams>) {
                on_diagnostics(n);
                if (handlers_.onPublishDiagnostics)
                    handlers_.onPublishDiagnostics(n);
            } else if constexpr (std::is_same_v<T, ipc::DidChangeBuildTarget>) {
                if (handlers_.onDidChangeBuildTarget)
                    handlers_.onDidChangeBuildTarget(n);
            } else {
                spdlog::debug("BuildClient: ignoring notification '{}'", n.method);
            }
        },
        decoded.value());
}

void BuildClient::on_task_start(const ipc::TaskStartParams& params) {
    auto task = params.compileTask();
    if (!task) {
        return;
    }
    if (!params.originId) {
        spdlog::debug("BuildClient: compile task {} without originId", task->target.uri);
        return;
    }
    cache_->markStarted(*params.originId, task->target);
}

void BuildClient::on_task_finish(const ipc::TaskFinishParams& params) {
    auto report = params.compileReport();
    if (!report) {
        return;
    }
    auto origin = report->originId ? report->originId : params.originId;
    if (!origin) {
        spdlog::warn("BuildClient: compile report for {} without originId", report->target.uri);
        return;
    }

    CompileOutcome outcome;
    outcome.target = report->target;
    outcome.originId = *origin;
    outcome.status = params.status;
    outcome.errors = report->errors;
    outcome.warnings = report->warnings;
    outcome.noOp = report->noOp;

    std::optional<PendingAnalysis> analysis;
    if (report->analysisOut && !report->analysisOut->empty()) {
        auto location = ipc::uri_to_path(*report->analysisOut);
        outcome.analysisLocation = location ? *location : std::filesystem::path(*report->analysisOut);
        // Decoding runs on the pool, never on this strand
        analysis = decoder_(*outcome.analysisLocation);
    }

    auto target = outcome.target.uri;
    if (auto published = cache_->publish(*origin, std::move(outcome), std::move(analysis));
        !published) {
        spdlog::debug("BuildClient: outcome for {} in '{}' not published: {}", target, *origin,
                      published.error().message);
    }
}

void BuildClient::on_diagnostics(const ipc::PublishDiagnosticsParams& params) {
    if (!params.originId) {
        return;
    }
    cache_->appendDiagnostics(*params.originId, params.buildTarget, params.textDocument,
                              params.diagnostics, params.reset);
}

void BuildClient::on_closed(const Error& reason) {
    Error error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool expected = state_ == SessionState::ShuttingDown || state_ == SessionState::Closed;
        if (closeReason_.code == ErrorCode::Success) {
            closeReason_ = Error{ErrorCode::ConnectionLost, reason.message};
        }
        state_ = SessionState::Closed;
        fail_queue_locked(closeReason_);
        error = closeReason_;
        if (!expected) {
            spdlog::warn("BuildClient: connection lost: {}", reason.message);
        }
    }
    cache_->abandonActive(error);
}

} // namespace bsplink::client
