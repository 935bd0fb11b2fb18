#include <bsplink/core/format.h>
#include <bsplink/server/workspace_loader.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace bsplink::server {

using nlohmann::json;

namespace {

std::vector<std::filesystem::path> paths_of(const json& j, const char* key) {
    std::vector<std::filesystem::path> out;
    if (auto it = j.find(key); it != j.end()) {
        for (const auto& entry : it->get<std::vector<std::string>>()) {
            out.emplace_back(entry);
        }
    }
    return out;
}

template <typename T> void read_or(const json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

Result<ipc::ScalaPlatform> parse_platform(const json& j) {
    auto name = j.value("name", std::string("jvm"));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "jvm")
        return ipc::ScalaPlatform::Jvm;
    if (name == "js")
        return ipc::ScalaPlatform::Js;
    if (name == "native")
        return ipc::ScalaPlatform::Native;
    return Error{ErrorCode::InvalidArgument, bsplink::format("unknown platform '{}'", name)};
}

} // namespace

Result<ProjectDefinition> parse_project(const json& document) {
    try {
        if (!document.is_object()) {
            return Error{ErrorCode::InvalidArgument, "project file is not a JSON object"};
        }
        if (auto version = document.find("version");
            version != document.end() && version->is_string() && version->get<std::string>() != "1") {
            return Error{ErrorCode::InvalidArgument,
                         bsplink::format("unsupported project file version '{}'",
                                         version->get<std::string>())};
        }
        const auto& p = document.at("project");

        ProjectDefinition project;
        p.at("name").get_to(project.name);
        if (project.name.empty()) {
            return Error{ErrorCode::InvalidArgument, "project name is empty"};
        }
        project.directory = p.value("directory", std::string());
        read_or(p, "dependencies", project.dependencies);
        project.sources = paths_of(p, "sources");
        project.generatedSources = paths_of(p, "generatedSources");
        project.classesDir = p.value("classesDir", std::string());
        project.classpath = paths_of(p, "classpath");
        read_or(p, "scalacOptions", project.scalacOptions);
        read_or(p, "languageIds", project.languageIds);
        read_or(p, "tags", project.tags);

        if (auto platform = p.find("platform"); platform != p.end() && platform->is_object()) {
            auto kind = parse_platform(*platform);
            if (!kind) {
                return kind.error();
            }
            project.platform = kind.value();
        }

        if (auto scala = p.find("scala"); scala != p.end() && scala->is_object()) {
            ScalaInstance instance;
            read_or(*scala, "organization", instance.organization);
            read_or(*scala, "name", instance.name);
            scala->at("version").get_to(instance.version);
            instance.jars = paths_of(*scala, "jars");
            project.scala = std::move(instance);
        }

        if (auto resolution = p.find("resolution"); resolution != p.end() && resolution->is_object()) {
            for (const auto& m : resolution->value("modules", json::array())) {
                ResolvedModule module;
                read_or(m, "organization", module.organization);
                m.at("name").get_to(module.name);
                read_or(m, "version", module.version);
                for (const auto& a : m.value("artifacts", json::array())) {
                    ResolvedArtifact artifact;
                    read_or(a, "name", artifact.name);
                    if (auto classifier = a.find("classifier");
                        classifier != a.end() && classifier->is_string()) {
                        artifact.classifier = classifier->get<std::string>();
                    }
                    artifact.path = a.at("path").get<std::string>();
                    module.artifacts.push_back(std::move(artifact));
                }
                project.resolution.push_back(std::move(module));
            }
        }
        return project;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidArgument, e.what()};
    }
}

WorkspaceLoadResult load_projects(const std::filesystem::path& workspace) {
    WorkspaceLoadResult result;
    const auto dir = workspace / kWorkspaceDirName;

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        spdlog::info("No project configuration under {}", dir.string());
        return result;
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        result.problems.push_back(bsplink::format("{}: {}", dir.string(), ec.message()));
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        std::ifstream in(file);
        if (!in) {
            result.problems.push_back(bsplink::format("{}: cannot open", file.string()));
            continue;
        }
        json document = json::parse(in, nullptr, false);
        if (document.is_discarded()) {
            result.problems.push_back(bsplink::format("{}: malformed JSON", file.string()));
            continue;
        }
        auto project = parse_project(document);
        if (!project) {
            result.problems.push_back(
                bsplink::format("{}: {}", file.string(), project.error().message));
            continue;
        }
        result.projects.push_back(std::move(project).value());
    }

    for (const auto& problem : result.problems) {
        spdlog::warn("Skipping project file {}", problem);
    }
    spdlog::debug("Loaded {} project(s) from {}", result.projects.size(), dir.string());
    return result;
}

} // namespace bsplink::server
