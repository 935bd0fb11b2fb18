#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <bsplink/core/types.h>
#include <bsplink/server/build_target_graph.h>

namespace bsplink::server {

// Directory holding project files, analyses and default class directories.
inline constexpr const char* kWorkspaceDirName = ".bsplink";

struct WorkspaceLoadResult {
    std::vector<ProjectDefinition> projects;
    // One entry per skipped file
    std::vector<std::string> problems;
};

// Decode one project file:
//   {"version": "1", "project": {"name": ..., "directory": ..., "dependencies": [...],
//    "sources": [...], "classesDir": ..., "classpath": [...], "scalacOptions": [...],
//    "platform": {"name": "jvm"}, "scala": {...}, "resolution": {"modules": [...]}}}
Result<ProjectDefinition> parse_project(const nlohmann::json& document);

// Read every <workspace>/.bsplink/*.json in name order. Unreadable or malformed files are
// reported and skipped.
WorkspaceLoadResult load_projects(const std::filesystem::path& workspace);

} // namespace bsplink::server
