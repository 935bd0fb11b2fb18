#include <bsplink/client/connection_registry.h>
#include <bsplink/client/run_sync.h>

#include <spdlog/spdlog.h>

#include <vector>

namespace bsplink::client {

using boost::asio::awaitable;

namespace {

// Coroutine parameters live in the frame, so the launcher and client outlive a run_sync
// timeout.
awaitable<Result<LaunchResult>> launch(std::shared_ptr<Launcher> launcher, bool restart) {
    auto result = co_await launcher->connect(restart);
    co_return std::move(result);
}

awaitable<Result<ipc::InitializeBuildResult>> initialize(std::shared_ptr<BuildClient> client) {
    auto result = co_await client->initialize();
    co_return result;
}

awaitable<Result<void>> shutdown(std::shared_ptr<BuildClient> client) {
    auto result = co_await client->shutdown();
    co_return result;
}

bool healthy(const std::shared_ptr<BuildClient>& client) {
    return client && client->active() && client->connection()->alive();
}

} // namespace

ConnectionRegistry::ConnectionRegistry(BuildClientOptions clientOptions,
                                       BuildEventHandlers handlers)
    : clientOptions_(std::move(clientOptions)), handlers_(std::move(handlers)) {}

ConnectionRegistry::~ConnectionRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, slot] : slots_) {
        std::lock_guard<std::mutex> slotLock(slot->mutex);
        reset_slot_locked(*slot, false);
    }
    slots_.clear();
}

std::shared_ptr<ConnectionRegistry::Slot> ConnectionRegistry::slot_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[key];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

void ConnectionRegistry::reset_slot_locked(Slot& slot, bool terminateServer) {
    if (slot.client) {
        slot.client->close();
        slot.client.reset();
    }
    if (slot.process && terminateServer) {
        slot.process->terminate();
    }
    slot.process.reset();
}

Result<std::shared_ptr<BuildClient>> ConnectionRegistry::acquire(const LauncherOptions& options,
                                                                 bool restart) {
    const auto key = ipc::to_string(options.endpoint);
    auto slot = slot_for(key);
    std::lock_guard<std::mutex> lock(slot->mutex);

    if (!restart && healthy(slot->client)) {
        return slot->client;
    }
    if (slot->client) {
        spdlog::debug("ConnectionRegistry: replacing client for {} (state={})", key,
                      to_string(slot->client->state()));
    }
    reset_slot_locked(*slot, restart);

    auto launcher = std::make_shared<Launcher>(options);
    // The launcher bounds itself; the margin only covers scheduling
    const auto launchBudget = options.readinessTimeout + 2 * options.transport.connectTimeout +
                              std::chrono::seconds{5};
    auto launched = run_sync(launch(launcher, restart), launchBudget);
    if (!launched) {
        return launched.error();
    }
    auto result = std::move(launched).value();

    auto clientOptions = clientOptions_;
    if (clientOptions.requestTimeout.count() <= 0) {
        clientOptions.requestTimeout = options.transport.requestTimeout;
    }
    auto client = BuildClient::create(result.connection, clientOptions, handlers_);
    std::unique_ptr<ServerProcess> spawned;
    if (result.process) {
        if (ipc::is_stdio(options.endpoint)) {
            client->adopt_process(std::move(result.process));
        } else {
            spawned = std::move(result.process);
        }
    }

    auto initialized =
        run_sync(initialize(client), clientOptions.requestTimeout + std::chrono::seconds{1});
    if (!initialized) {
        spdlog::warn("ConnectionRegistry: initialize on {} failed: {}", key,
                     initialized.error().message);
        client->close();
        if (spawned) {
            spawned->terminate();
        }
        return initialized.error();
    }

    slot->client = client;
    slot->process = std::move(spawned);
    return client;
}

void ConnectionRegistry::release(const ipc::TransportEndpoint& endpoint) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(ipc::to_string(endpoint));
        if (it == slots_.end()) {
            return;
        }
        slot = it->second;
        slots_.erase(it);
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    reset_slot_locked(*slot, false);
}

void ConnectionRegistry::shutdown_all(std::chrono::milliseconds timeout) {
    std::vector<std::pair<std::string, std::shared_ptr<Slot>>> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots.assign(slots_.begin(), slots_.end());
        slots_.clear();
    }
    for (auto& [key, slot] : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (healthy(slot->client)) {
            auto done = run_sync(shutdown(slot->client), timeout);
            if (!done) {
                spdlog::warn("ConnectionRegistry: shutdown of {} failed: {}", key,
                             done.error().message);
            }
        }
        reset_slot_locked(*slot, false);
    }
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace bsplink::client
