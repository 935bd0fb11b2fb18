#include <bsplink/core/format.h>
#include <bsplink/server/build_target_graph.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <set>
#include <unordered_set>

namespace bsplink::server {

namespace {

std::string encode_component(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

// "2.12.18" -> "2.12", "3.3.1" -> "3"
std::string binary_version(const std::string& version) {
    if (version.starts_with("3.")) {
        return "3";
    }
    auto first = version.find('.');
    if (first == std::string::npos) {
        return version;
    }
    auto second = version.find('.', first + 1);
    return version.substr(0, second);
}

std::filesystem::path absolute_in(const std::filesystem::path& base,
                                  const std::filesystem::path& p) {
    if (p.empty() || p.is_absolute()) {
        return p.lexically_normal();
    }
    return (base / p).lexically_normal();
}

ipc::BuildTarget make_target(const std::filesystem::path& workspace,
                             const ProjectDefinition& project,
                             std::vector<ipc::BuildTargetIdentifier> dependencies) {
    ipc::BuildTarget target;
    target.id = BuildTargetGraph::target_id(workspace, project.name);
    target.displayName = project.name;
    if (!project.directory.empty()) {
        target.baseDirectory = ipc::path_to_uri(project.directory);
    }
    target.tags = project.tags;
    target.languageIds = project.languageIds;
    std::sort(target.languageIds.begin(), target.languageIds.end());
    target.dependencies = std::move(dependencies);
    target.capabilities.canCompile = true;
    target.capabilities.canTest =
        std::find(project.tags.begin(), project.tags.end(), "test") != project.tags.end();
    target.capabilities.canRun = !target.capabilities.canTest;

    if (project.scala) {
        ipc::ScalaBuildTarget scala;
        scala.scalaOrganization = project.scala->organization;
        scala.scalaVersion = project.scala->version;
        scala.scalaBinaryVersion = binary_version(project.scala->version);
        scala.platform = project.platform;
        for (const auto& jar : project.scala->jars) {
            scala.jars.push_back(ipc::path_to_uri(jar));
        }
        target.dataKind = std::string(ipc::kScalaTargetKind);
        target.data = ipc::json(scala);
    }
    return target;
}

} // namespace

ipc::BuildTargetIdentifier BuildTargetGraph::target_id(const std::filesystem::path& workspace,
                                                       std::string_view name) {
    auto base = ipc::path_to_uri(workspace);
    if (!base.ends_with('/')) {
        base.push_back('/');
    }
    return ipc::BuildTargetIdentifier{bsplink::format("{}?id={}", base, encode_component(name))};
}

std::shared_ptr<const BuildTargetGraph>
BuildTargetGraph::build(const std::filesystem::path& workspace,
                        std::vector<ProjectDefinition> projects) {
    auto graph = std::make_shared<BuildTargetGraph>();
    graph->workspace_ = workspace.lexically_normal();

    // Names must be unique; the first definition wins
    std::unordered_map<std::string, std::size_t> byName;
    std::vector<ProjectDefinition> unique;
    for (auto& project : projects) {
        if (project.name.empty()) {
            graph->problems_.push_back("project without a name skipped");
            continue;
        }
        if (byName.contains(project.name)) {
            graph->problems_.push_back(
                bsplink::format("duplicate project '{}' skipped", project.name));
            continue;
        }
        if (project.directory.empty()) {
            project.directory = graph->workspace_ / project.name;
        }
        project.directory = absolute_in(graph->workspace_, project.directory);
        // Several spellings of one file collapse to one entry; authored wins over generated
        std::set<std::filesystem::path> seen;
        auto normalize = [&](std::vector<std::filesystem::path>& list) {
            std::vector<std::filesystem::path> kept;
            for (const auto& source : list) {
                auto path = absolute_in(project.directory, source);
                if (seen.insert(path).second) {
                    kept.push_back(std::move(path));
                }
            }
            list = std::move(kept);
        };
        normalize(project.sources);
        normalize(project.generatedSources);
        if (project.classesDir.empty()) {
            project.classesDir = graph->workspace_ / ".bsplink" / "classes" / project.name;
        }
        project.classesDir = absolute_in(graph->workspace_, project.classesDir);
        byName.emplace(project.name, unique.size());
        unique.push_back(std::move(project));
    }

    // Direct edges, unknown dependencies dropped
    std::vector<std::vector<std::size_t>> deps(unique.size());
    std::vector<std::size_t> indegree(unique.size(), 0);
    std::vector<std::vector<std::size_t>> dependents(unique.size());
    for (std::size_t i = 0; i < unique.size(); ++i) {
        std::unordered_set<std::size_t> seen;
        for (const auto& name : unique[i].dependencies) {
            auto it = byName.find(name);
            if (it == byName.end()) {
                graph->problems_.push_back(bsplink::format(
                    "project '{}' depends on unknown project '{}'", unique[i].name, name));
                continue;
            }
            if (!seen.insert(it->second).second) {
                continue;
            }
            deps[i].push_back(it->second);
            dependents[it->second].push_back(i);
            ++indegree[i];
        }
    }

    // Kahn's algorithm, stable with respect to definition order
    std::set<std::size_t> ready;
    for (std::size_t i = 0; i < unique.size(); ++i) {
        if (indegree[i] == 0) {
            ready.insert(i);
        }
    }
    std::vector<std::size_t> order;
    order.reserve(unique.size());
    while (!ready.empty()) {
        auto next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);
        for (auto dependent : dependents[next]) {
            if (--indegree[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (order.size() != unique.size()) {
        std::vector<std::string> cyclic;
        for (std::size_t i = 0; i < unique.size(); ++i) {
            if (indegree[i] > 0) {
                cyclic.push_back(unique[i].name);
            }
        }
        std::string names;
        for (const auto& name : cyclic) {
            names += names.empty() ? name : ", " + name;
        }
        graph->problems_.push_back(
            bsplink::format("recursive dependencies between projects: {}", names));
        spdlog::warn("Build target graph is unresolvable: recursive dependencies between {}",
                     names);
        return graph;
    }

    std::vector<std::size_t> position(unique.size());
    for (std::size_t pos = 0; pos < order.size(); ++pos) {
        position[order[pos]] = pos;
    }
    for (auto original : order) {
        std::vector<ipc::BuildTargetIdentifier> ids;
        std::vector<std::size_t> edges;
        for (auto dep : deps[original]) {
            ids.push_back(target_id(graph->workspace_, unique[dep].name));
            edges.push_back(position[dep]);
        }
        auto target = make_target(graph->workspace_, unique[original], std::move(ids));
        graph->byUri_.emplace(target.id.uri, graph->targets_.size());
        graph->targets_.push_back(std::move(target));
        graph->edges_.push_back(std::move(edges));
        graph->projects_.push_back(std::move(unique[original]));
    }
    for (const auto& problem : graph->problems_) {
        spdlog::warn("Build target graph: {}", problem);
    }
    return graph;
}

bool BuildTargetGraph::contains(const ipc::BuildTargetIdentifier& id) const {
    return byUri_.contains(id.uri);
}

Result<std::size_t> BuildTargetGraph::index_of(const ipc::BuildTargetIdentifier& id) const {
    auto it = byUri_.find(id.uri);
    if (it == byUri_.end()) {
        return Error{ErrorCode::UnknownTarget, bsplink::format("unknown build target {}", id.uri)};
    }
    return it->second;
}

const ProjectDefinition* BuildTargetGraph::project(const ipc::BuildTargetIdentifier& id) const {
    auto it = byUri_.find(id.uri);
    return it == byUri_.end() ? nullptr : &projects_[it->second];
}

const ipc::BuildTarget* BuildTargetGraph::target(const ipc::BuildTargetIdentifier& id) const {
    auto it = byUri_.find(id.uri);
    return it == byUri_.end() ? nullptr : &targets_[it->second];
}

std::vector<std::size_t> BuildTargetGraph::closure(std::size_t index) const {
    std::vector<bool> seen(targets_.size(), false);
    std::deque<std::size_t> pending(edges_[index].begin(), edges_[index].end());
    std::vector<std::size_t> out;
    while (!pending.empty()) {
        auto next = pending.front();
        pending.pop_front();
        if (seen[next]) {
            continue;
        }
        seen[next] = true;
        out.push_back(next);
        pending.insert(pending.end(), edges_[next].begin(), edges_[next].end());
    }
    // Indices follow dependency order
    std::sort(out.begin(), out.end());
    return out;
}

Result<ipc::ScalacOptionsItem>
BuildTargetGraph::compilerOptions(const ipc::BuildTargetIdentifier& id) const {
    auto index = index_of(id);
    if (!index) {
        return index.error();
    }
    const auto& project = projects_[index.value()];

    ipc::ScalacOptionsItem item;
    item.target = targets_[index.value()].id;
    item.options = project.scalacOptions;
    item.classDirectory = ipc::path_to_uri(project.classesDir);

    std::unordered_set<std::string> seen;
    auto add = [&](const std::filesystem::path& entry) {
        auto uri = ipc::path_to_uri(entry);
        if (seen.insert(uri).second) {
            item.classpath.push_back(std::move(uri));
        }
    };
    add(project.classesDir);
    auto deps = closure(index.value());
    // Nearest dependencies first
    for (auto it = deps.rbegin(); it != deps.rend(); ++it) {
        add(projects_[*it].classesDir);
    }
    for (const auto& entry : project.classpath) {
        add(entry);
    }
    return item;
}

Result<ipc::SourcesItem> BuildTargetGraph::sources(const ipc::BuildTargetIdentifier& id) const {
    auto index = index_of(id);
    if (!index) {
        return index.error();
    }
    const auto& project = projects_[index.value()];

    ipc::SourcesItem item;
    item.target = targets_[index.value()].id;
    std::unordered_set<std::string> seen;
    auto add = [&item, &seen](const std::filesystem::path& path, bool generated) {
        auto uri = ipc::path_to_uri(path);
        if (!seen.insert(uri).second) {
            return;
        }
        std::error_code ec;
        ipc::SourceItem source;
        source.uri = std::move(uri);
        source.kind = std::filesystem::is_directory(path, ec) ? ipc::SourceItemKind::Directory
                                                              : ipc::SourceItemKind::File;
        source.generated = generated;
        item.sources.push_back(std::move(source));
    };
    for (const auto& source : project.sources) {
        add(source, false);
    }
    for (const auto& source : project.generatedSources) {
        add(source, true);
    }
    item.roots.push_back(ipc::path_to_uri(project.directory));
    return item;
}

Result<ipc::DependencySourcesItem>
BuildTargetGraph::dependencySources(const ipc::BuildTargetIdentifier& id) const {
    auto index = index_of(id);
    if (!index) {
        return index.error();
    }

    ipc::DependencySourcesItem item;
    item.target = targets_[index.value()].id;
    std::unordered_set<std::string> seen;
    auto collect = [&](const ProjectDefinition& project) {
        for (const auto& module : project.resolution) {
            for (const auto& artifact : module.artifacts) {
                if (artifact.classifier != "sources") {
                    continue;
                }
                auto uri = ipc::path_to_uri(artifact.path);
                if (seen.insert(uri).second) {
                    item.sources.push_back(std::move(uri));
                }
            }
        }
    };
    collect(projects_[index.value()]);
    for (auto dep : closure(index.value())) {
        collect(projects_[dep]);
    }
    return item;
}

Result<std::vector<ipc::BuildTargetIdentifier>>
BuildTargetGraph::compileOrder(const std::vector<ipc::BuildTargetIdentifier>& requested) const {
    std::set<std::size_t> selected;
    for (const auto& id : requested) {
        auto index = index_of(id);
        if (!index) {
            return index.error();
        }
        selected.insert(index.value());
        for (auto dep : closure(index.value())) {
            selected.insert(dep);
        }
    }
    std::vector<ipc::BuildTargetIdentifier> order;
    order.reserve(selected.size());
    for (auto index : selected) {
        order.push_back(targets_[index].id);
    }
    return order;
}

} // namespace bsplink::server
