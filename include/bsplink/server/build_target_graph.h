#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <bsplink/core/types.h>
#include <bsplink/ipc/bsp_protocol.h>

namespace bsplink::server {

struct ResolvedArtifact {
    std::string name;
    std::optional<std::string> classifier;
    std::filesystem::path path;
};

struct ResolvedModule {
    std::string organization;
    std::string name;
    std::string version;
    std::vector<ResolvedArtifact> artifacts;
};

struct ScalaInstance {
    std::string organization{"org.scala-lang"};
    std::string name{"scala-compiler"};
    std::string version;
    std::vector<std::filesystem::path> jars;
};

// One project of the workspace as read from configuration.
struct ProjectDefinition {
    std::string name;
    std::filesystem::path directory;
    std::vector<std::string> dependencies;
    std::vector<std::filesystem::path> sources;
    std::vector<std::filesystem::path> generatedSources;
    std::filesystem::path classesDir;
    std::vector<std::filesystem::path> classpath;
    std::vector<std::string> scalacOptions;
    std::vector<std::string> languageIds{"scala", "java"};
    std::vector<std::string> tags;
    ipc::ScalaPlatform platform{ipc::ScalaPlatform::Jvm};
    std::optional<ScalaInstance> scala;
    std::vector<ResolvedModule> resolution;
};

/**
 * Immutable index of the workspace's build targets.
 *
 * Built once from project definitions; a reload builds a new graph. Targets are kept in
 * dependency order (dependencies before dependents). A workspace whose projects form a cycle
 * resolves to an empty graph, with the cycle reported in problems().
 *
 * Target ids are "file://<workspace>/?id=<name>".
 */
class BuildTargetGraph {
public:
    BuildTargetGraph() = default;

    static std::shared_ptr<const BuildTargetGraph> build(const std::filesystem::path& workspace,
                                                         std::vector<ProjectDefinition> projects);

    static ipc::BuildTargetIdentifier target_id(const std::filesystem::path& workspace,
                                                std::string_view name);

    const std::filesystem::path& workspace() const noexcept { return workspace_; }
    const std::vector<ipc::BuildTarget>& targets() const noexcept { return targets_; }
    std::size_t size() const noexcept { return targets_.size(); }
    bool empty() const noexcept { return targets_.empty(); }
    bool contains(const ipc::BuildTargetIdentifier& id) const;

    const ProjectDefinition* project(const ipc::BuildTargetIdentifier& id) const;
    const ipc::BuildTarget* target(const ipc::BuildTargetIdentifier& id) const;

    // Own classes directory, dependency classes directories (transitively, each once), then
    // the project's classpath; duplicates dropped.
    Result<ipc::ScalacOptionsItem> compilerOptions(const ipc::BuildTargetIdentifier& id) const;
    Result<ipc::SourcesItem> sources(const ipc::BuildTargetIdentifier& id) const;
    // Artifacts classified "sources" of the target's resolution and of every project it
    // depends on, deduplicated.
    Result<ipc::DependencySourcesItem>
    dependencySources(const ipc::BuildTargetIdentifier& id) const;

    // The requested targets plus their transitive dependencies, in dependency order.
    Result<std::vector<ipc::BuildTargetIdentifier>>
    compileOrder(const std::vector<ipc::BuildTargetIdentifier>& requested) const;

    // Problems found while building (unknown dependencies, duplicates, cycles).
    const std::vector<std::string>& problems() const noexcept { return problems_; }

private:
    std::vector<std::size_t> closure(std::size_t index) const;
    Result<std::size_t> index_of(const ipc::BuildTargetIdentifier& id) const;

    std::filesystem::path workspace_;
    // Parallel vectors in dependency order
    std::vector<ipc::BuildTarget> targets_;
    std::vector<ProjectDefinition> projects_;
    std::vector<std::vector<std::size_t>> edges_;
    std::unordered_map<std::string, std::size_t> byUri_;
    std::vector<std::string> problems_;
};

} // namespace bsplink::server
