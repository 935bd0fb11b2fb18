#include <bsplink/server/workspace.h>
#include <bsplink/server/workspace_loader.h>

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace bsplink::server {

namespace {

// Filesystem-safe form of an originId
std::string file_component(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(c == '/' || c == '\\' || c == '\0' ? '_' : c);
    }
    if (out.empty() || out == "." || out == "..") {
        out = "_" + out;
    }
    return out;
}

bool same_inputs(const ProjectDefinition& a, const ProjectDefinition& b) {
    return a.sources == b.sources && a.generatedSources == b.generatedSources &&
           a.classesDir == b.classesDir && a.classpath == b.classpath &&
           a.scalacOptions == b.scalacOptions;
}

} // namespace

Workspace::Workspace(std::filesystem::path root, GraphLoader loader)
    : root_(std::move(root)), loader_(std::move(loader)) {
    if (!loader_) {
        loader_ = &Workspace::load_from_disk;
    }
    graph_ = loader_(root_);
    spdlog::info("Workspace {}: {} build target(s)", root_.string(), graph_->size());
}

std::shared_ptr<const BuildTargetGraph> Workspace::load_from_disk(const std::filesystem::path& root) {
    auto loaded = load_projects(root);
    return BuildTargetGraph::build(root, std::move(loaded.projects));
}

std::shared_ptr<const BuildTargetGraph> Workspace::graph() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return graph_;
}

std::vector<ipc::BuildTargetEvent> Workspace::reload() {
    auto next = loader_(root_);

    std::vector<ipc::BuildTargetEvent> changes;
    std::vector<ChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::unordered_map<std::string, const ipc::BuildTarget*> previous;
        for (const auto& target : graph_->targets()) {
            previous.emplace(target.id.uri, &target);
        }
        for (const auto& target : next->targets()) {
            auto it = previous.find(target.id.uri);
            if (it == previous.end()) {
                changes.push_back({target.id, ipc::BuildTargetEventKind::Created});
                continue;
            }
            if (ipc::json(*it->second) != ipc::json(target) ||
                !same_inputs(*graph_->project(target.id), *next->project(target.id))) {
                changes.push_back({target.id, ipc::BuildTargetEventKind::Changed});
            }
            previous.erase(it);
        }
        for (const auto& [uri, target] : previous) {
            changes.push_back({target->id, ipc::BuildTargetEventKind::Deleted});
        }
        graph_ = std::move(next);
        for (const auto& [token, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    spdlog::info("Workspace {} reloaded: {} change(s)", root_.string(), changes.size());
    if (!changes.empty()) {
        for (const auto& listener : listeners) {
            listener(changes);
        }
    }
    return changes;
}

std::shared_ptr<std::mutex> Workspace::target_lock(const ipc::BuildTargetIdentifier& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = targetLocks_[id.uri];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

std::filesystem::path Workspace::analysis_path(const std::string& targetName,
                                               const std::string& originId) const {
    return root_ / kWorkspaceDirName / "analysis" / file_component(targetName) /
           (file_component(originId) + ".analysis");
}

uint64_t Workspace::subscribe(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto token = nextToken_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void Workspace::unsubscribe(uint64_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(token);
}

} // namespace bsplink::server
