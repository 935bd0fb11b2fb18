#include <gtest/gtest.h>
#include <bsplink/ipc/bsp_protocol.h>

namespace bsplink::ipc::test {

TEST(BspUri, PathToUriEncodesReservedCharacters) {
    EXPECT_EQ(path_to_uri("/work/my project/a#b.scala"),
              "file:///work/my%20project/a%23b.scala");
    EXPECT_EQ(path_to_uri("/work/./sub/../x"), "file:///work/x");
}

TEST(BspUri, UriToPathDecodes) {
    auto path = uri_to_path("file:///work/my%20project/A.scala");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, "/work/my project/A.scala");

    auto withQuery = uri_to_path("file:///ws/?id=core");
    ASSERT_TRUE(withQuery.has_value());
    EXPECT_EQ(*withQuery, "/ws/");

    EXPECT_TRUE(uri_to_path("file://localhost/tmp/x").has_value());
    EXPECT_FALSE(uri_to_path("file://otherhost/tmp/x").has_value());
    EXPECT_FALSE(uri_to_path("https://example.com/x").has_value());
}

TEST(BspUri, RoundTripsUnusualNames) {
    std::filesystem::path original = "/tmp/ä ö/[x]+y%z.analysis";
    auto back = uri_to_path(path_to_uri(original));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, original);
}

TEST(BspErrors, JsonRpcCodeMapping) {
    EXPECT_EQ(toJsonRpcError(ErrorCode::UnknownTarget), JsonRpcErrorCode::UnknownTarget);
    EXPECT_EQ(toJsonRpcError(ErrorCode::InvalidArgument), JsonRpcErrorCode::InvalidParams);
    EXPECT_EQ(toJsonRpcError(ErrorCode::OperationCancelled), JsonRpcErrorCode::RequestCancelled);
    EXPECT_EQ(toJsonRpcError(ErrorCode::InvalidState), JsonRpcErrorCode::ServerNotInitialized);
    EXPECT_EQ(toJsonRpcError(ErrorCode::NotFound), JsonRpcErrorCode::MethodNotFound);
    EXPECT_EQ(toJsonRpcError(ErrorCode::InternalError), JsonRpcErrorCode::InternalError);

    EXPECT_EQ(fromJsonRpcError(-32001), ErrorCode::UnknownTarget);
    EXPECT_EQ(fromJsonRpcError(-32602), ErrorCode::InvalidArgument);
    EXPECT_EQ(fromJsonRpcError(-32800), ErrorCode::OperationCancelled);
    EXPECT_EQ(fromJsonRpcError(-32002), ErrorCode::InvalidState);
    EXPECT_EQ(fromJsonRpcError(-32603), ErrorCode::ProtocolError);
    EXPECT_EQ(fromJsonRpcError(12345), ErrorCode::ProtocolError);
}

TEST(BspNotifications, DecodesTaskStartWithCompileTask) {
    json params = {{"taskId", {{"id", "c-1-0"}}},
                   {"originId", "c-1"},
                   {"message", "Compiling core"},
                   {"dataKind", "compile-task"},
                   {"data", {{"target", {{"uri", "file:///ws/?id=core"}}}}}};
    auto decoded = decode_notification(methods::kTaskStart, params);
    ASSERT_TRUE(decoded) << decoded.error().message;
    auto* start = std::get_if<TaskStartParams>(&decoded.value());
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->originId, "c-1");
    auto task = start->compileTask();
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->target.uri, "file:///ws/?id=core");
}

TEST(BspNotifications, DecodesTaskFinishWithCompileReport) {
    json params = {{"taskId", {{"id", "c-1-0"}}},
                   {"originId", "c-1"},
                   {"status", 2},
                   {"dataKind", "compile-report"},
                   {"data",
                    {{"target", {{"uri", "file:///ws/?id=core"}}},
                     {"errors", 1},
                     {"warnings", 3},
                     {"analysisOut", "file:///ws/.bsplink/analysis/core/c-1.analysis"}}}};
    auto decoded = decode_notification(methods::kTaskFinish, params);
    ASSERT_TRUE(decoded);
    auto& finish = std::get<TaskFinishParams>(decoded.value());
    EXPECT_EQ(finish.status, StatusCode::Error);
    auto report = finish.compileReport();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->errors, 1);
    EXPECT_EQ(report->warnings, 3);
    EXPECT_FALSE(report->noOp);
    ASSERT_TRUE(report->analysisOut.has_value());
}

TEST(BspNotifications, ReportIgnoredForOtherDataKinds) {
    TaskFinishParams finish;
    finish.dataKind = "test-report";
    finish.data = json{{"target", {{"uri", "x"}}}};
    EXPECT_FALSE(finish.compileReport().has_value());
}

TEST(BspNotifications, DecodesDiagnosticsWithReset) {
    json params = {{"textDocument", {{"uri", "file:///ws/A.scala"}}},
                   {"buildTarget", {{"uri", "file:///ws/?id=core"}}},
                   {"originId", "c-2"},
                   {"reset", true},
                   {"diagnostics",
                    json::array({{{"range",
                                   {{"start", {{"line", 3}, {"character", 4}}},
                                    {"end", {{"line", 3}, {"character", 9}}}}},
                                  {"severity", 1},
                                  {"message", "type mismatch"}}})}};
    auto decoded = decode_notification(methods::kPublishDiagnostics, params);
    ASSERT_TRUE(decoded) << decoded.error().message;
    auto& diagnostics = std::get<PublishDiagnosticsParams>(decoded.value());
    EXPECT_EQ(diagnostics.textDocument, "file:///ws/A.scala");
    EXPECT_TRUE(diagnostics.reset);
    ASSERT_EQ(diagnostics.diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.diagnostics[0].range.start.line, 3);
    EXPECT_EQ(diagnostics.diagnostics[0].severity, DiagnosticSeverity::Error);
}

TEST(BspNotifications, UnknownMethodIsUnrecognizedNotProtocolError) {
    auto decoded = decode_notification("build/somethingNew", json{{"x", 1}});
    ASSERT_TRUE(decoded);
    auto* unknown = std::get_if<UnrecognizedNotification>(&decoded.value());
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->method, "build/somethingNew");
}

TEST(BspNotifications, MalformedKnownNotificationIsProtocolError) {
    auto decoded = decode_notification(methods::kLogMessage, json{{"type", "loud"}});
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::ProtocolError);
}

TEST(BspNotifications, EncodeUsesMethodOfAlternative) {
    LogMessageParams log;
    log.type = MessageType::Warning;
    log.message = "careful";
    auto [method, params] = encode_notification(BuildNotification{log});
    EXPECT_EQ(method, methods::kLogMessage);
    EXPECT_EQ(params.at("type"), 2);
    EXPECT_EQ(params.at("message"), "careful");

    DidChangeBuildTarget change;
    change.changes.push_back({{"file:///ws/?id=core"}, BuildTargetEventKind::Changed});
    auto [changeMethod, changeParams] = encode_notification(BuildNotification{change});
    EXPECT_EQ(changeMethod, methods::kDidChangeBuildTarget);
    EXPECT_EQ(changeParams.at("changes").at(0).at("kind"), 2);
}

TEST(BspTypes, BuildTargetOptionalFieldsOmitted) {
    BuildTarget target;
    target.id.uri = "file:///ws/?id=core";
    target.languageIds = {"scala"};
    json j = target;
    EXPECT_FALSE(j.contains("displayName"));
    EXPECT_FALSE(j.contains("data"));
    EXPECT_TRUE(j.at("capabilities").at("canCompile").get<bool>());

    auto back = decode_as<BuildTarget>(j);
    ASSERT_TRUE(back);
    EXPECT_EQ(back.value().id, target.id);
}

TEST(BspTypes, DecodeAsMapsJsonErrors) {
    auto decoded = decode_as<CompileParams>(json{{"targets", "not-an-array"}});
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, ErrorCode::ProtocolError);
}

} // namespace bsplink::ipc::test
