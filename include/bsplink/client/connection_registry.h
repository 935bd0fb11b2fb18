#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <bsplink/client/build_client.h>
#include <bsplink/client/launcher.h>
#include <bsplink/core/types.h>

namespace bsplink::client {

/**
 * Initialized build clients keyed by endpoint.
 *
 * acquire() hands out the cached client while it is Active and its connection alive. Anything
 * else launches (or reconnects to) the server and initializes a fresh client under the
 * endpoint's slot mutex, so concurrent callers for one endpoint share a single launch.
 *
 * restart = true closes the cached client, terminates the server process this registry
 * started for the endpoint, and always spawns a new one.
 *
 * Blocking; must not be called from a thread of the global io_context.
 */
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(BuildClientOptions clientOptions = {},
                                BuildEventHandlers handlers = BuildEventHandlers::logging());
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    Result<std::shared_ptr<BuildClient>> acquire(const LauncherOptions& options,
                                                 bool restart = false);

    // Close the cached client for an endpoint. The server keeps running.
    void release(const ipc::TransportEndpoint& endpoint);

    // build/shutdown on every Active client, then close them all.
    void shutdown_all(std::chrono::milliseconds timeout = std::chrono::seconds{5});

    std::size_t size() const;

private:
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<BuildClient> client;
        // Server this registry spawned for the endpoint (detached for socket endpoints)
        std::unique_ptr<ServerProcess> process;
    };

    std::shared_ptr<Slot> slot_for(const std::string& key);
    static void reset_slot_locked(Slot& slot, bool terminateServer);

    BuildClientOptions clientOptions_;
    BuildEventHandlers handlers_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace bsplink::client
