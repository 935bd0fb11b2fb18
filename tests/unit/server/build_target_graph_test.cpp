#include <gtest/gtest.h>
#include <bsplink/server/build_target_graph.h>

#include <algorithm>

namespace bsplink::server::test {

namespace {

const std::filesystem::path kWorkspace = "/ws";

ProjectDefinition project(std::string name, std::vector<std::string> deps = {}) {
    ProjectDefinition p;
    p.name = std::move(name);
    p.dependencies = std::move(deps);
    return p;
}

ipc::BuildTargetIdentifier id(std::string_view name) {
    return BuildTargetGraph::target_id(kWorkspace, name);
}

std::vector<std::string> uris(const std::vector<ipc::BuildTargetIdentifier>& ids) {
    std::vector<std::string> out;
    for (const auto& i : ids) {
        out.push_back(i.uri);
    }
    return out;
}

} // namespace

TEST(BuildTargetGraph, TargetIdsEncodeNames) {
    EXPECT_EQ(id("core").uri, "file:///ws/?id=core");
    EXPECT_EQ(id("my app").uri, "file:///ws/?id=my%20app");
}

TEST(BuildTargetGraph, TargetsInDependencyOrder) {
    auto graph = BuildTargetGraph::build(
        kWorkspace, {project("app", {"core", "util"}), project("util", {"core"}), project("core")});
    ASSERT_EQ(graph->size(), 3u);
    EXPECT_EQ(graph->targets()[0].id, id("core"));
    EXPECT_EQ(graph->targets()[1].id, id("util"));
    EXPECT_EQ(graph->targets()[2].id, id("app"));
    EXPECT_TRUE(graph->problems().empty());

    const auto* app = graph->target(id("app"));
    ASSERT_NE(app, nullptr);
    EXPECT_EQ(app->dependencies.size(), 2u);
    EXPECT_EQ(app->displayName, "app");
    EXPECT_TRUE(app->capabilities.canCompile);
}

TEST(BuildTargetGraph, CycleResolvesToEmptyGraph) {
    auto graph = BuildTargetGraph::build(
        kWorkspace, {project("a", {"b"}), project("b", {"c"}), project("c", {"a"}), project("d")});
    EXPECT_TRUE(graph->empty());
    ASSERT_FALSE(graph->problems().empty());
    EXPECT_NE(graph->problems().back().find("a, b, c"), std::string::npos);
}

TEST(BuildTargetGraph, UnknownDependencyAndDuplicateReported) {
    auto graph = BuildTargetGraph::build(
        kWorkspace, {project("core", {"missing"}), project("core", {}), project("app", {"core"})});
    EXPECT_EQ(graph->size(), 2u);
    EXPECT_EQ(graph->problems().size(), 2u);
    EXPECT_TRUE(graph->target(id("core"))->dependencies.empty());
}

TEST(BuildTargetGraph, CompilerOptionsClasspathIsUnique) {
    auto core = project("core");
    core.classpath = {"/lib/scala-library.jar"};
    auto util = project("util", {"core"});
    util.classpath = {"/lib/scala-library.jar", "/lib/cats.jar"};
    auto app = project("app", {"util", "core"});
    app.classpath = {"/lib/scala-library.jar", "/lib/cats.jar", "/lib/app.jar"};
    app.scalacOptions = {"-deprecation"};
    app.classesDir = "out/app";

    auto graph = BuildTargetGraph::build(kWorkspace, {core, util, app});
    auto options = graph->compilerOptions(id("app"));
    ASSERT_TRUE(options) << options.error().message;
    const auto& cp = options.value().classpath;

    std::vector<std::string> sorted = cp;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end());
    ASSERT_EQ(cp.size(), 6u);
    EXPECT_EQ(cp.front(), "file:///ws/out/app");
    EXPECT_EQ(options.value().classDirectory, "file:///ws/out/app");
    EXPECT_NE(std::find(cp.begin(), cp.end(), "file:///ws/.bsplink/classes/core"), cp.end());
    EXPECT_EQ(options.value().options, std::vector<std::string>{"-deprecation"});
}

TEST(BuildTargetGraph, DependencySourcesAreTransitiveAndDeduplicated) {
    auto withSources = [](std::string name, std::vector<std::string> deps,
                          std::vector<std::string> jars) {
        auto p = project(std::move(name), std::move(deps));
        ResolvedModule module;
        module.name = "lib";
        for (const auto& jar : jars) {
            module.artifacts.push_back({"lib", std::string("sources"), jar});
            module.artifacts.push_back({"lib", std::nullopt, jar + ".bin"});
        }
        p.resolution.push_back(module);
        return p;
    };
    auto graph = BuildTargetGraph::build(
        kWorkspace, {withSources("core", {}, {"/m2/a-sources.jar"}),
                     withSources("app", {"core"}, {"/m2/b-sources.jar", "/m2/a-sources.jar"})});
    auto sources = graph->dependencySources(id("app"));
    ASSERT_TRUE(sources);
    std::vector<std::string> expected = {"file:///m2/b-sources.jar", "file:///m2/a-sources.jar"};
    EXPECT_EQ(sources.value().sources, expected);
}

TEST(BuildTargetGraph, SourcesResolveAgainstProjectDirectory) {
    auto core = project("core");
    core.directory = "modules/core";
    core.sources = {"src/A.scala", "/abs/B.scala"};
    core.generatedSources = {"target/gen"};
    auto graph = BuildTargetGraph::build(kWorkspace, {core});
    auto sources = graph->sources(id("core"));
    ASSERT_TRUE(sources);
    ASSERT_EQ(sources.value().sources.size(), 3u);
    EXPECT_EQ(sources.value().sources[0].uri, "file:///ws/modules/core/src/A.scala");
    EXPECT_EQ(sources.value().sources[1].uri, "file:///abs/B.scala");
    EXPECT_TRUE(sources.value().sources[2].generated);
    EXPECT_EQ(sources.value().roots, std::vector<std::string>{"file:///ws/modules/core"});
}

TEST(BuildTargetGraph, SourceSpellingsOfOneFileCollapse) {
    auto a = project("a");
    a.directory = "/ws/a";
    a.sources = {"src/A.scala", "./src/A.scala", "/ws/a/src/A.scala", "src/../src/B.scala"};
    a.generatedSources = {"src/B.scala", "gen/C.scala"};
    auto graph = BuildTargetGraph::build(kWorkspace, {a});

    auto sources = graph->sources(id("a"));
    ASSERT_TRUE(sources);
    ASSERT_EQ(sources.value().sources.size(), 3u);
    EXPECT_EQ(sources.value().sources[0].uri, "file:///ws/a/src/A.scala");
    EXPECT_EQ(sources.value().sources[1].uri, "file:///ws/a/src/B.scala");
    EXPECT_FALSE(sources.value().sources[1].generated);
    EXPECT_EQ(sources.value().sources[2].uri, "file:///ws/a/gen/C.scala");
    EXPECT_TRUE(sources.value().sources[2].generated);

    // Compiles see the same set
    const auto* definition = graph->project(id("a"));
    ASSERT_NE(definition, nullptr);
    EXPECT_EQ(definition->sources.size(), 2u);
    EXPECT_EQ(definition->generatedSources.size(), 1u);
}

TEST(BuildTargetGraph, CompileOrderIncludesDependencies) {
    auto graph = BuildTargetGraph::build(
        kWorkspace, {project("app", {"util"}), project("util", {"core"}), project("core"),
                     project("docs")});
    auto order = graph->compileOrder({id("app")});
    ASSERT_TRUE(order);
    std::vector<std::string> expected = {id("core").uri, id("util").uri, id("app").uri};
    EXPECT_EQ(uris(order.value()), expected);

    auto unknown = graph->compileOrder({id("nope")});
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownTarget);
}

TEST(BuildTargetGraph, ScalaDataAttached) {
    auto core = project("core");
    ScalaInstance scala;
    scala.version = "2.13.12";
    scala.jars = {"/lib/scala-compiler.jar"};
    core.scala = scala;
    auto graph = BuildTargetGraph::build(kWorkspace, {core});
    const auto* target = graph->target(id("core"));
    ASSERT_NE(target, nullptr);
    ASSERT_TRUE(target->dataKind.has_value());
    EXPECT_EQ(*target->dataKind, ipc::kScalaTargetKind);
    EXPECT_EQ(target->data->at("scalaBinaryVersion"), "2.13");
}

} // namespace bsplink::server::test
