#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <bsplink/client/compile_result_cache.h>
#include <bsplink/client/server_process.h>
#include <bsplink/core/types.h>
#include <bsplink/ipc/bsp_protocol.h>
#include <bsplink/ipc/connection.h>
#include <bsplink/ipc/json_rpc_peer.h>
#include <bsplink/ipc/thread_pool.h>

namespace bsplink::client {

enum class SessionState { Uninitialized, Initializing, Active, ShuttingDown, Closed };

const char* to_string(SessionState state) noexcept;

// Callbacks for server notifications. Invoked on the connection's I/O strand; must not block.
struct BuildEventHandlers {
    std::function<void(const ipc::LogMessageParams&)> onLogMessage;
    std::function<void(const ipc::ShowMessageParams&)> onShowMessage;
    std::function<void(const ipc::PublishDiagnosticsParams&)> onPublishDiagnostics;
    std::function<void(const ipc::TaskStartParams&)> onTaskStart;
    std::function<void(const ipc::TaskProgressParams&)> onTaskProgress;
    std::function<void(const ipc::TaskFinishParams&)> onTaskFinish;
    std::function<void(const ipc::DidChangeBuildTarget&)> onDidChangeBuildTarget;

    // Log and show messages go to spdlog by message type; task starts are logged at info
    // except no-op compilations.
    static BuildEventHandlers logging();
};

struct BuildClientOptions {
    std::string clientName{"bsplink"};
    std::string clientVersion{"0.1.0"};
    std::filesystem::path workspace;
    std::vector<std::string> languageIds{"scala", "java"};
    std::chrono::milliseconds requestTimeout{30000};
    // Waiting for a compile response; non-positive waits without deadline
    std::chrono::milliseconds compileTimeout{0};
    std::size_t decodeThreads{2};
    CompileResultCacheOptions cache;
};

/**
 * Client end of a build-server session.
 *
 * Lifecycle: Uninitialized -> Initializing -> Active -> ShuttingDown -> Closed. Requests issued
 * before the session is Active are queued and sent in arrival order once initialize()
 * succeeds (or failed when it does not).
 *
 * Compile notifications feed the CompileResultCache: task starts mark targets as started,
 * diagnostics accumulate per (originId, target), and a compile report at task finish
 * publishes the outcome with its analysis decoded on the decode pool.
 *
 * Losing the connection fails every pending request and every in-flight compile with
 * ConnectionLost.
 */
class BuildClient : public std::enable_shared_from_this<BuildClient> {
public:
    static std::shared_ptr<BuildClient>
    create(std::shared_ptr<ipc::Connection> connection, BuildClientOptions options = {},
           BuildEventHandlers handlers = BuildEventHandlers::logging(),
           std::shared_ptr<IAnalysisReader> reader = std::make_shared<FileAnalysisReader>());
    ~BuildClient();

    BuildClient(const BuildClient&) = delete;
    BuildClient& operator=(const BuildClient&) = delete;

    boost::asio::awaitable<Result<ipc::InitializeBuildResult>> initialize();

    boost::asio::awaitable<Result<std::vector<ipc::BuildTarget>>> listBuildTargets();

    boost::asio::awaitable<Result<ipc::ScalacOptionsItem>>
    getCompilerOptions(ipc::BuildTargetIdentifier target);

    boost::asio::awaitable<Result<ipc::SourcesItem>> getSources(ipc::BuildTargetIdentifier target);

    boost::asio::awaitable<Result<ipc::DependencySourcesItem>>
    getDependencySources(ipc::BuildTargetIdentifier target);

    // Returns the acknowledgement once the server finished the compile. Outcomes are read
    // from cache() under the returned originId. An empty originId is generated.
    boost::asio::awaitable<Result<ipc::CompileResult>>
    compile(std::vector<ipc::BuildTargetIdentifier> targets, std::string originId = {});

    // Cancel a compile in flight. Already published outcomes stay in the cache.
    Result<void> cancelCompile(const std::string& originId);

    boost::asio::awaitable<Result<void>> reloadWorkspace();

    // build/shutdown, build/exit, then close the connection.
    boost::asio::awaitable<Result<void>> shutdown();

    // Drop the connection without the shutdown handshake.
    void close();

    SessionState state() const;
    bool active() const { return state() == SessionState::Active; }
    std::optional<ipc::InitializeBuildResult> serverInfo() const;

    std::shared_ptr<CompileResultCache> cache() const { return cache_; }
    std::shared_ptr<ipc::Connection> connection() const { return connection_; }
    const BuildClientOptions& options() const noexcept { return options_; }

    // Tie a server process (stdio launches) to the lifetime of this client.
    void adopt_process(std::unique_ptr<ServerProcess> process);

    std::string next_origin_id();

private:
    BuildClient(std::shared_ptr<ipc::Connection> connection, BuildClientOptions options,
                BuildEventHandlers handlers, std::shared_ptr<IAnalysisReader> reader);

    struct QueuedCall {
        std::string method;
        ipc::json params;
        std::shared_ptr<std::promise<Result<ipc::JsonRpcPeer::PendingRequest>>> sent;
    };
    using SentFuture = std::shared_future<Result<ipc::JsonRpcPeer::PendingRequest>>;

    void start();
    SentFuture submit(std::string method, ipc::json params);
    void flush_queue_locked();
    void fail_queue_locked(const Error& error);

    boost::asio::awaitable<Result<ipc::JsonRpcPeer::PendingRequest>>
    await_sent(SentFuture sent, std::chrono::milliseconds timeout);
    boost::asio::awaitable<Result<ipc::json>> call(std::string method, ipc::json params,
                                                   std::chrono::milliseconds timeout);

    void on_notification(const std::string& method, const ipc::json& params);
    void on_task_start(const ipc::TaskStartParams& params);
    void on_task_finish(const ipc::TaskFinishParams& params);
    void on_diagnostics(const ipc::PublishDiagnosticsParams& params);
    void on_closed(const Error& reason);

    std::shared_ptr<ipc::Connection> connection_;
    BuildClientOptions options_;
    BuildEventHandlers handlers_;
    std::shared_ptr<ipc::ThreadPool> decodePool_;
    AnalysisDecoder decoder_;
    std::shared_ptr<CompileResultCache> cache_;
    std::shared_ptr<ipc::JsonRpcPeer> peer_;

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    Error closeReason_;
    std::deque<QueuedCall> queue_;
    std::optional<ipc::InitializeBuildResult> serverInfo_;
    // originId -> request id of the compile in flight (0 while still queued)
    std::unordered_map<std::string, int64_t> compiles_;
    std::unique_ptr<ServerProcess> process_;
    std::atomic<uint64_t> originCounter_{0};
};

} // namespace bsplink::client
