#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <bsplink/core/types.h>
#include <bsplink/ipc/bsp_protocol.h>
#include <bsplink/ipc/connection.h>
#include <bsplink/ipc/json_rpc_peer.h>
#include <bsplink/ipc/thread_pool.h>
#include <bsplink/server/compile_engine.h>
#include <bsplink/server/workspace.h>

namespace bsplink::server {

struct ServerSessionOptions {
    std::string serverName{"bsplink-server"};
    std::string serverVersion{"0.1.0"};
    std::vector<std::string> languageIds{"scala", "java"};
};

// Where a session runs its requests. buildTarget/compile goes to `compiles` (to `requests`
// when unset) so a long compile does not delay queries and lifecycle requests.
struct SessionExecutors {
    std::shared_ptr<ipc::ThreadPool> requests;
    std::shared_ptr<ipc::ThreadPool> compiles;
};

/**
 * Server end of one client connection.
 *
 * Requests run on the server's request pool and compiles on its compile pool. Until build/initialize succeeds every other request
 * is answered with -32002; unknown methods get -32601.
 *
 * buildTarget/compile compiles the requested targets and their dependencies in dependency
 * order. Each compiled target produces build/taskStart (compile-task),
 * build/publishDiagnostics per file and build/taskFinish (compile-report carrying the
 * analysis URI), all tagged with the originId. Targets depending on a failed target finish as
 * Cancelled without compiling. $/cancelRequest is honoured between targets.
 *
 * build/exit closes the connection; the close handler then fires once.
 */
class BuildServerSession : public std::enable_shared_from_this<BuildServerSession> {
public:
    enum class State { AwaitingInitialize, Running, ShuttingDown, Exited };

    static std::shared_ptr<BuildServerSession>
    create(std::shared_ptr<ipc::Connection> connection, std::shared_ptr<Workspace> workspace,
           std::shared_ptr<ICompileEngine> engine, SessionExecutors executors,
           ServerSessionOptions options = {});
    ~BuildServerSession();

    BuildServerSession(const BuildServerSession&) = delete;
    BuildServerSession& operator=(const BuildServerSession&) = delete;

    void start(std::function<void(const Error&)> onClosed = {});
    void close();

    State state() const noexcept { return state_.load(std::memory_order_acquire); }
    // build/shutdown was received before the connection ended
    bool shutdown_requested() const noexcept {
        return shutdownRequested_.load(std::memory_order_acquire);
    }
    std::string describe() const { return connection_->describe(); }

private:
    BuildServerSession(std::shared_ptr<ipc::Connection> connection,
                       std::shared_ptr<Workspace> workspace, std::shared_ptr<ICompileEngine> engine,
                       SessionExecutors executors, ServerSessionOptions options);

    Result<ipc::json> dispatch(const ipc::RequestContext& ctx, const ipc::json& params);
    void on_notification(const std::string& method);

    Result<ipc::json> handle_initialize(const ipc::json& params);
    Result<ipc::json> handle_build_targets();
    Result<ipc::json> handle_scalac_options(const ipc::json& params);
    Result<ipc::json> handle_sources(const ipc::json& params);
    Result<ipc::json> handle_dependency_sources(const ipc::json& params);
    Result<ipc::json> handle_compile(const ipc::RequestContext& ctx, const ipc::json& params);
    Result<ipc::json> handle_reload();
    Result<ipc::json> handle_shutdown();

    ipc::StatusCode compile_target(const BuildTargetGraph& graph,
                                   const ipc::BuildTargetIdentifier& target,
                                   const std::string& originId, const std::string& taskId,
                                   const ipc::RequestContext& ctx);
    void finish_skipped(const ipc::BuildTargetIdentifier& target, const std::string& originId,
                        const std::string& taskId, const std::string& reason);
    void send(const ipc::BuildNotification& notification);
    void log_to_client(ipc::MessageType type, std::string message,
                       std::optional<std::string> originId = std::nullopt);

    std::shared_ptr<ipc::Connection> connection_;
    std::shared_ptr<Workspace> workspace_;
    std::shared_ptr<ICompileEngine> engine_;
    ServerSessionOptions options_;
    std::shared_ptr<ipc::JsonRpcPeer> peer_;

    std::atomic<State> state_{State::AwaitingInitialize};
    std::atomic<bool> shutdownRequested_{false};
    std::atomic<uint64_t> compileCounter_{0};
    uint64_t subscription_{0};
    std::once_flag closedOnce_;
    std::function<void(const Error&)> onClosed_;
};

const char* to_string(BuildServerSession::State state) noexcept;

} // namespace bsplink::server
