#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <bsplink/core/types.h>
#include <bsplink/ipc/bsp_protocol.h>
#include <bsplink/server/build_target_graph.h>

namespace bsplink::server {

/**
 * The workspace served by one server process, shared by all of its sessions.
 *
 * graph() returns a snapshot; reload() builds a new graph from disk and swaps it in, then
 * tells every subscriber which targets were created, changed or deleted. Compiles of one
 * target are serialized through target_lock() across sessions.
 */
class Workspace {
public:
    using ChangeListener = std::function<void(const std::vector<ipc::BuildTargetEvent>&)>;
    using GraphLoader =
        std::function<std::shared_ptr<const BuildTargetGraph>(const std::filesystem::path&)>;

    // Loads <root>/.bsplink/*.json unless a loader is supplied.
    explicit Workspace(std::filesystem::path root, GraphLoader loader = {});

    const std::filesystem::path& root() const noexcept { return root_; }

    std::shared_ptr<const BuildTargetGraph> graph() const;

    // Returns the changes applied.
    std::vector<ipc::BuildTargetEvent> reload();

    std::shared_ptr<std::mutex> target_lock(const ipc::BuildTargetIdentifier& id);

    // <root>/.bsplink/analysis/<target>/<originId>.analysis
    std::filesystem::path analysis_path(const std::string& targetName,
                                        const std::string& originId) const;

    uint64_t subscribe(ChangeListener listener);
    void unsubscribe(uint64_t token);

    static std::shared_ptr<const BuildTargetGraph> load_from_disk(const std::filesystem::path& root);

private:
    std::filesystem::path root_;
    GraphLoader loader_;

    mutable std::mutex mutex_;
    std::shared_ptr<const BuildTargetGraph> graph_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> targetLocks_;
    std::map<uint64_t, ChangeListener> listeners_;
    uint64_t nextToken_{1};
};

} // namespace bsplink::server
