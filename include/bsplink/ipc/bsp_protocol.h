#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <bsplink/core/types.h>

namespace bsplink::ipc {

using json = nlohmann::json;

// BSP version spoken by this implementation. Peers must agree on the major component.
inline constexpr std::string_view kBspVersion = "2.1.0";

// Token exchanged between launcher and server binary (argv and ready sentinel).
inline constexpr std::string_view kServerProtocolToken = "bsplink-1";

// Line the server prints once it accepts connections: "<sentinel> <endpoint> <token>"
inline constexpr std::string_view kReadySentinel = "BSPLINK_SERVER_READY";

namespace methods {
inline constexpr std::string_view kInitialize = "build/initialize";
inline constexpr std::string_view kInitialized = "build/initialized";
inline constexpr std::string_view kShutdown = "build/shutdown";
inline constexpr std::string_view kExit = "build/exit";
inline constexpr std::string_view kBuildTargets = "workspace/buildTargets";
inline constexpr std::string_view kReload = "workspace/reload";
inline constexpr std::string_view kScalacOptions = "buildTarget/scalacOptions";
inline constexpr std::string_view kSources = "buildTarget/sources";
inline constexpr std::string_view kDependencySources = "buildTarget/dependencySources";
inline constexpr std::string_view kCompile = "buildTarget/compile";
inline constexpr std::string_view kCancelRequest = "$/cancelRequest";
inline constexpr std::string_view kTaskStart = "build/taskStart";
inline constexpr std::string_view kTaskProgress = "build/taskProgress";
inline constexpr std::string_view kTaskFinish = "build/taskFinish";
inline constexpr std::string_view kLogMessage = "build/logMessage";
inline constexpr std::string_view kShowMessage = "build/showMessage";
inline constexpr std::string_view kPublishDiagnostics = "build/publishDiagnostics";
inline constexpr std::string_view kDidChangeBuildTarget = "buildTarget/didChange";
} // namespace methods

// JSON-RPC error codes used on the wire
enum class JsonRpcErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ServerNotInitialized = -32002,
    UnknownTarget = -32001,
    RequestCancelled = -32800,
};

ErrorCode fromJsonRpcError(int code) noexcept;
JsonRpcErrorCode toJsonRpcError(ErrorCode code) noexcept;

// file:// URIs as used for workspace, source and analysis locations. Characters outside the
// unreserved set (and '/') are percent-encoded.
std::string path_to_uri(const std::filesystem::path& path);
// Fails for non-file URIs. Query and fragment are ignored.
std::optional<std::filesystem::path> uri_to_path(std::string_view uri);

// Data kinds
inline constexpr std::string_view kCompileTaskKind = "compile-task";
inline constexpr std::string_view kCompileReportKind = "compile-report";
inline constexpr std::string_view kScalaTargetKind = "scala";

struct BuildTargetIdentifier {
    std::string uri;

    bool operator==(const BuildTargetIdentifier&) const = default;
    auto operator<=>(const BuildTargetIdentifier&) const = default;
};

struct BuildTargetCapabilities {
    bool canCompile{true};
    bool canTest{false};
    bool canRun{false};
    bool canDebug{false};
};

enum class ScalaPlatform : int { Jvm = 1, Js = 2, Native = 3 };

struct ScalaBuildTarget {
    std::string scalaOrganization;
    std::string scalaVersion;
    std::string scalaBinaryVersion;
    ScalaPlatform platform{ScalaPlatform::Jvm};
    std::vector<std::string> jars;
};

struct BuildTarget {
    BuildTargetIdentifier id;
    std::optional<std::string> displayName;
    std::optional<std::string> baseDirectory;
    std::vector<std::string> tags;
    std::vector<std::string> languageIds;
    std::vector<BuildTargetIdentifier> dependencies;
    BuildTargetCapabilities capabilities;
    std::optional<std::string> dataKind;
    std::optional<json> data;
};

struct BuildClientCapabilities {
    std::vector<std::string> languageIds;
};

struct InitializeBuildParams {
    std::string displayName;
    std::string version;
    std::string bspVersion{kBspVersion};
    std::string rootUri;
    BuildClientCapabilities capabilities;
    std::optional<json> data;
};

struct CompileProvider {
    std::vector<std::string> languageIds;
};

struct BuildServerCapabilities {
    std::optional<CompileProvider> compileProvider;
    bool dependencySourcesProvider{false};
    bool canReload{false};
    bool buildTargetChangedProvider{false};
};

struct InitializeBuildResult {
    std::string displayName;
    std::string version;
    std::string bspVersion;
    BuildServerCapabilities capabilities;
    std::optional<json> data;
};

struct WorkspaceBuildTargetsResult {
    std::vector<BuildTarget> targets;
};

struct TargetsParams {
    std::vector<BuildTargetIdentifier> targets;
};

struct ScalacOptionsItem {
    BuildTargetIdentifier target;
    std::vector<std::string> options;
    std::vector<std::string> classpath;
    std::string classDirectory;
};

struct ScalacOptionsResult {
    std::vector<ScalacOptionsItem> items;
};

enum class SourceItemKind : int { File = 1, Directory = 2 };

struct SourceItem {
    std::string uri;
    SourceItemKind kind{SourceItemKind::File};
    bool generated{false};
};

struct SourcesItem {
    BuildTargetIdentifier target;
    std::vector<SourceItem> sources;
    std::vector<std::string> roots;
};

struct SourcesResult {
    std::vector<SourcesItem> items;
};

struct DependencySourcesItem {
    BuildTargetIdentifier target;
    std::vector<std::string> sources;
};

struct DependencySourcesResult {
    std::vector<DependencySourcesItem> items;
};

struct CompileParams {
    std::vector<BuildTargetIdentifier> targets;
    std::optional<std::string> originId;
    std::vector<std::string> arguments;
};

enum class StatusCode : int { Ok = 1, Error = 2, Cancelled = 3 };

const char* to_string(StatusCode status) noexcept;

struct CompileResult {
    std::optional<std::string> originId;
    StatusCode statusCode{StatusCode::Ok};
    std::optional<std::string> dataKind;
    std::optional<json> data;
};

struct TaskId {
    std::string id;
    std::vector<std::string> parents;
};

struct CompileTask {
    BuildTargetIdentifier target;
};

struct CompileReport {
    BuildTargetIdentifier target;
    std::optional<std::string> originId;
    int errors{0};
    int warnings{0};
    std::optional<int64_t> time;
    bool noOp{false};
    // Location of the serialized analysis produced by the compile.
    std::optional<std::string> analysisOut;
};

struct TaskStartParams {
    TaskId taskId;
    std::optional<std::string> originId;
    std::optional<int64_t> eventTime;
    std::optional<std::string> message;
    std::optional<std::string> dataKind;
    std::optional<json> data;

    // Compile task carried in data when dataKind is compile-task
    std::optional<CompileTask> compileTask() const;
};

struct TaskProgressParams {
    TaskId taskId;
    std::optional<std::string> originId;
    std::optional<int64_t> eventTime;
    std::optional<std::string> message;
    std::optional<int64_t> total;
    std::optional<int64_t> progress;
    std::optional<std::string> unit;
    std::optional<std::string> dataKind;
    std::optional<json> data;
};

struct TaskFinishParams {
    TaskId taskId;
    std::optional<std::string> originId;
    std::optional<int64_t> eventTime;
    std::optional<std::string> message;
    StatusCode status{StatusCode::Ok};
    std::optional<std::string> dataKind;
    std::optional<json> data;

    // Compile report carried in data when dataKind is compile-report
    std::optional<CompileReport> compileReport() const;
};

enum class MessageType : int { Error = 1, Warning = 2, Info = 3, Log = 4 };

struct LogMessageParams {
    MessageType type{MessageType::Log};
    std::optional<TaskId> task;
    std::optional<std::string> originId;
    std::string message;
};

struct ShowMessageParams {
    MessageType type{MessageType::Info};
    std::optional<TaskId> task;
    std::optional<std::string> originId;
    std::string message;
};

struct Position {
    int line{0};
    int character{0};
};

struct Range {
    Position start;
    Position end;
};

enum class DiagnosticSeverity : int { Error = 1, Warning = 2, Information = 3, Hint = 4 };

struct Diagnostic {
    Range range;
    std::optional<DiagnosticSeverity> severity;
    std::optional<std::string> code;
    std::optional<std::string> source;
    std::string message;
};

struct PublishDiagnosticsParams {
    std::string textDocument; // uri
    BuildTargetIdentifier buildTarget;
    std::optional<std::string> originId;
    std::vector<Diagnostic> diagnostics;
    bool reset{false};
};

enum class BuildTargetEventKind : int { Created = 1, Changed = 2, Deleted = 3 };

struct BuildTargetEvent {
    BuildTargetIdentifier target;
    std::optional<BuildTargetEventKind> kind;
};

struct DidChangeBuildTarget {
    std::vector<BuildTargetEvent> changes;
};

struct UnrecognizedNotification {
    std::string method;
    json params;
};

// Server-to-client notifications, decoded by explicit method match.
using BuildNotification =
    std::variant<TaskStartParams, TaskProgressParams, TaskFinishParams, LogMessageParams,
                 ShowMessageParams, PublishDiagnosticsParams, DidChangeBuildTarget,
                 UnrecognizedNotification>;

// Unknown methods decode to UnrecognizedNotification. A known method with malformed params
// is a ProtocolError.
Result<BuildNotification> decode_notification(std::string_view method, const json& params);

// Method name and params for sending a notification.
std::pair<std::string_view, json> encode_notification(const BuildNotification& notification);

// Decode a typed payload, mapping json exceptions to ProtocolError.
template <typename T> Result<T> decode_as(const json& j) {
    try {
        return j.get<T>();
    } catch (const json::exception& e) {
        return Error{ErrorCode::ProtocolError, e.what()};
    }
}

// JSON conversions
void to_json(json& j, const BuildTargetIdentifier& v);
void from_json(const json& j, BuildTargetIdentifier& v);
void to_json(json& j, const BuildTargetCapabilities& v);
void from_json(const json& j, BuildTargetCapabilities& v);
void to_json(json& j, const ScalaBuildTarget& v);
void from_json(const json& j, ScalaBuildTarget& v);
void to_json(json& j, const BuildTarget& v);
void from_json(const json& j, BuildTarget& v);
void to_json(json& j, const InitializeBuildParams& v);
void from_json(const json& j, InitializeBuildParams& v);
void to_json(json& j, const BuildServerCapabilities& v);
void from_json(const json& j, BuildServerCapabilities& v);
void to_json(json& j, const InitializeBuildResult& v);
void from_json(const json& j, InitializeBuildResult& v);
void to_json(json& j, const WorkspaceBuildTargetsResult& v);
void from_json(const json& j, WorkspaceBuildTargetsResult& v);
void to_json(json& j, const TargetsParams& v);
void from_json(const json& j, TargetsParams& v);
void to_json(json& j, const ScalacOptionsItem& v);
void from_json(const json& j, ScalacOptionsItem& v);
void to_json(json& j, const ScalacOptionsResult& v);
void from_json(const json& j, ScalacOptionsResult& v);
void to_json(json& j, const SourceItem& v);
void from_json(const json& j, SourceItem& v);
void to_json(json& j, const SourcesItem& v);
void from_json(const json& j, SourcesItem& v);
void to_json(json& j, const SourcesResult& v);
void from_json(const json& j, SourcesResult& v);
void to_json(json& j, const DependencySourcesItem& v);
void from_json(const json& j, DependencySourcesItem& v);
void to_json(json& j, const DependencySourcesResult& v);
void from_json(const json& j, DependencySourcesResult& v);
void to_json(json& j, const CompileParams& v);
void from_json(const json& j, CompileParams& v);
void to_json(json& j, const CompileResult& v);
void from_json(const json& j, CompileResult& v);
void to_json(json& j, const TaskId& v);
void from_json(const json& j, TaskId& v);
void to_json(json& j, const CompileTask& v);
void from_json(const json& j, CompileTask& v);
void to_json(json& j, const CompileReport& v);
void from_json(const json& j, CompileReport& v);
void to_json(json& j, const TaskStartParams& v);
void from_json(const json& j, TaskStartParams& v);
void to_json(json& j, const TaskProgressParams& v);
void from_json(const json& j, TaskProgressParams& v);
void to_json(json& j, const TaskFinishParams& v);
void from_json(const json& j, TaskFinishParams& v);
void to_json(json& j, const LogMessageParams& v);
void from_json(const json& j, LogMessageParams& v);
void to_json(json& j, const ShowMessageParams& v);
void from_json(const json& j, ShowMessageParams& v);
void to_json(json& j, const Position& v);
void from_json(const json& j, Position& v);
void to_json(json& j, const Range& v);
void from_json(const json& j, Range& v);
void to_json(json& j, const Diagnostic& v);
void from_json(const json& j, Diagnostic& v);
void to_json(json& j, const PublishDiagnosticsParams& v);
void from_json(const json& j, PublishDiagnosticsParams& v);
void to_json(json& j, const BuildTargetEvent& v);
void from_json(const json& j, BuildTargetEvent& v);
void to_json(json& j, const DidChangeBuildTarget& v);
void from_json(const json& j, DidChangeBuildTarget& v);

} // namespace bsplink::ipc
