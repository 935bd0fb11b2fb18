#include <bsplink/core/format.h>
#include <bsplink/ipc/bsp_protocol.h>

#include <cctype>

namespace bsplink::ipc {

namespace {

template <typename T> void put_opt(json& j, const char* key, const std::optional<T>& v) {
    if (v) {
        j[key] = *v;
    }
}

template <typename T> void get_opt(const json& j, const char* key, std::optional<T>& v) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        v = it->template get<T>();
    } else {
        v.reset();
    }
}

template <typename T> void get_or(const json& j, const char* key, T& v) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        v = it->template get<T>();
    }
}

template <typename E> void get_enum(const json& j, const char* key, E& v) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        v = static_cast<E>(it->template get<int>());
    }
}

} // namespace

ErrorCode fromJsonRpcError(int code) noexcept {
    switch (static_cast<JsonRpcErrorCode>(code)) {
        case JsonRpcErrorCode::UnknownTarget:
            return ErrorCode::UnknownTarget;
        case JsonRpcErrorCode::InvalidParams:
            return ErrorCode::InvalidArgument;
        case JsonRpcErrorCode::RequestCancelled:
            return ErrorCode::OperationCancelled;
        case JsonRpcErrorCode::ServerNotInitialized:
            return ErrorCode::InvalidState;
        default:
            return ErrorCode::ProtocolError;
    }
}

JsonRpcErrorCode toJsonRpcError(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::UnknownTarget:
            return JsonRpcErrorCode::UnknownTarget;
        case ErrorCode::InvalidArgument:
            return JsonRpcErrorCode::InvalidParams;
        case ErrorCode::OperationCancelled:
            return JsonRpcErrorCode::RequestCancelled;
        case ErrorCode::InvalidState:
            return JsonRpcErrorCode::ServerNotInitialized;
        case ErrorCode::ProtocolError:
            return JsonRpcErrorCode::InvalidRequest;
        case ErrorCode::NotFound:
            return JsonRpcErrorCode::MethodNotFound;
        default:
            return JsonRpcErrorCode::InternalError;
    }
}

const char* to_string(StatusCode status) noexcept {
    switch (status) {
        case StatusCode::Ok:
            return "ok";
        case StatusCode::Error:
            return "error";
        case StatusCode::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::string path_to_uri(const std::filesystem::path& path) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    auto text = path.lexically_normal().generic_string();
    std::string uri = "file://";
    uri.reserve(uri.size() + text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~') {
            uri.push_back(static_cast<char>(c));
        } else {
            uri.push_back('%');
            uri.push_back(kHex[c >> 4]);
            uri.push_back(kHex[c & 0x0F]);
        }
    }
    return uri;
}

std::optional<std::filesystem::path> uri_to_path(std::string_view uri) {
    constexpr std::string_view kScheme = "file://";
    if (uri.substr(0, kScheme.size()) != kScheme) {
        return std::nullopt;
    }
    uri.remove_prefix(kScheme.size());
    if (auto cut = uri.find_first_of("?#"); cut != std::string_view::npos) {
        uri = uri.substr(0, cut);
    }
    // file://host/path is accepted only for an empty or localhost authority
    if (!uri.empty() && uri.front() != '/') {
        auto slash = uri.find('/');
        if (slash == std::string_view::npos || uri.substr(0, slash) != "localhost") {
            return std::nullopt;
        }
        uri.remove_prefix(slash);
    }
    if (uri.empty()) {
        return std::nullopt;
    }

    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };
    std::string decoded;
    decoded.reserve(uri.size());
    for (std::size_t i = 0; i < uri.size(); ++i) {
        if (uri[i] == '%' && i + 2 < uri.size()) {
            int hi = hex(uri[i + 1]);
            int lo = hex(uri[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        decoded.push_back(uri[i]);
    }
    return std::filesystem::path(decoded);
}

std::optional<CompileTask> TaskStartParams::compileTask() const {
    if (!dataKind || *dataKind != kCompileTaskKind || !data) {
        return std::nullopt;
    }
    auto task = decode_as<CompileTask>(*data);
    if (!task) {
        return std::nullopt;
    }
    return std::move(task).value();
}

std::optional<CompileReport> TaskFinishParams::compileReport() const {
    if (!dataKind || *dataKind != kCompileReportKind || !data) {
        return std::nullopt;
    }
    auto report = decode_as<CompileReport>(*data);
    if (!report) {
        return std::nullopt;
    }
    return std::move(report).value();
}

Result<BuildNotification> decode_notification(std::string_view method, const json& params) {
    auto wrap = [&](auto decoded) -> Result<BuildNotification> {
        if (!decoded) {
            return Error{ErrorCode::ProtocolError,
                         bsplink::format("malformed {} params: {}", method,
                                         decoded.error().message)};
        }
        return BuildNotification{std::move(decoded).value()};
    };

    if (method == methods::kTaskStart)
        return wrap(decode_as<TaskStartParams>(params));
    if (method == methods::kTaskProgress)
        return wrap(decode_as<TaskProgressParams>(params));
    if (method == methods::kTaskFinish)
        return wrap(decode_as<TaskFinishParams>(params));
    if (method == methods::kLogMessage)
        return wrap(decode_as<LogMessageParams>(params));
    if (method == methods::kShowMessage)
        return wrap(decode_as<ShowMessageParams>(params));
    if (method == methods::kPublishDiagnostics)
        return wrap(decode_as<PublishDiagnosticsParams>(params));
    if (method == methods::kDidChangeBuildTarget)
        return wrap(decode_as<DidChangeBuildTarget>(params));
    return BuildNotification{UnrecognizedNotification{std::string(method), params}};
}

std::pair<std::string_view, json> encode_notification(const BuildNotification& notification) {
    return std::visit(
        [](const auto& n) -> std::pair<std::string_view, json> {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, TaskStartParams>) {
                return {methods::kTaskStart, json(n)};
            } else if constexpr (std::is_same_v<T, TaskProgressParams>) {
                return {methods::kTaskProgress, json(n)};
            } else if constexpr (std::is_same_v<T, TaskFinishParams>) {
                return {methods::kTaskFinish, json(n)};
            } else if constexpr (std::is_same_v<T, LogMessageParams>) {
                return {methods::kLogMessage, json(n)};
            } else if constexpr (std::is_same_v<T, ShowMessageParams>) {
                return {methods::kShowMessage, json(n)};
            } else if constexpr (std::is_same_v<T, PublishDiagnosticsParams>) {
                return {methods::kPublishDiagnostics, json(n)};
            } else if constexpr (std::is_same_v<T, DidChangeBuildTarget>) {
                return {methods::kDidChangeBuildTarget, json(n)};
            } else {
                return {n.method, n.params};
            }
        },
        notification);
}

// BuildTargetIdentifier

void to_json(json& j, const BuildTargetIdentifier& v) {
    j = json{{"uri", v.uri}};
}

void from_json(const json& j, BuildTargetIdentifier& v) {
    j.at("uri").get_to(v.uri);
}

// BuildTargetCapabilities

void to_json(json& j, const BuildTargetCapabilities& v) {
    j = json{{"canCompile", v.canCompile},
             {"canTest", v.canTest},
             {"canRun", v.canRun},
             {"canDebug", v.canDebug}};
}

void from_json(const json& j, BuildTargetCapabilities& v) {
    get_or(j, "canCompile", v.canCompile);
    get_or(j, "canTest", v.canTest);
    get_or(j, "canRun", v.canRun);
    get_or(j, "canDebug", v.canDebug);
}

// ScalaBuildTarget

void to_json(json& j, const ScalaBuildTarget& v) {
    j = json{{"scalaOrganization", v.scalaOrganization},
             {"scalaVersion", v.scalaVersion},
             {"scalaBinaryVersion", v.scalaBinaryVersion},
             {"platform", static_cast<int>(v.platform)},
             {"jars", v.jars}};
}

void from_json(const json& j, ScalaBuildTarget& v) {
    j.at("scalaOrganization").get_to(v.scalaOrganization);
    j.at("scalaVersion").get_to(v.scalaVersion);
    j.at("scalaBinaryVersion").get_to(v.scalaBinaryVersion);
    get_enum(j, "platform", v.platform);
    get_or(j, "jars", v.jars);
}

// BuildTarget

void to_json(json& j, const BuildTarget& v) {
    j = json{{"id", v.id},
             {"tags", v.tags},
             {"languageIds", v.languageIds},
             {"dependencies", v.dependencies},
             {"capabilities", v.capabilities}};
    put_opt(j, "displayName", v.displayName);
    put_opt(j, "baseDirectory", v.baseDirectory);
    put_opt(j, "dataKind", v.dataKind);
    put_opt(j, "data", v.data);
}

void from_json(const json& j, BuildTarget& v) {
    j.at("id").get_to(v.id);
    get_opt(j, "displayName", v.displayName);
    get_opt(j, "baseDirectory", v.baseDirectory);
    get_or(j, "tags", v.tags);
    get_or(j, "languageIds", v.languageIds);
    get_or(j, "dependencies", v.dependencies);
    get_or(j, "capabilities", v.capabilities);
    get_opt(j, "dataKind", v.dataKind);
    get_opt(j, "data", v.data);
}

// Initialize

void to_json(json& j, const InitializeBuildParams& v) {
    j = json{{"displayName", v.displayName},
             {"version", v.version},
             {"bspVersion", v.bspVersion},
             {"rootUri", v.rootUri},
             {"capabilities", json{{"languageIds", v.capabilities.languageIds}}}};
    put_opt(j, "data", v.data);
}

void from_json(const json& j, InitializeBuildParams& v) {
    j.at("displayName").get_to(v.displayName);
    j.at("version").get_to(v.version);
    j.at("bspVersion").get_to(v.bspVersion);
    j.at("rootUri").get_to(v.rootUri);
    if (auto it = j.find("capabilities"); it != j.end() && it->is_object()) {
        get_or(*it, "languageIds", v.capabilities.languageIds);
    }
    get_opt(j, "data", v.data);
}

void to_json(json& j, const BuildServerCapabilities& v) {
    j = json{{"dependencySourcesProvider", v.dependencySourcesProvider},
             {"canReload", v.canReload},
             {"buildTargetChangedProvider", v.buildTargetChangedProvider}};
    if (v.compileProvider) {
        j["compileProvider"] = json{{"languageIds", v.compileProvider->languageIds}};
    }
}

void from_json(const json& j, BuildServerCapabilities& v) {
    if (auto it = j.find("compileProvider"); it != j.end() && it->is_object()) {
        CompileProvider provider;
        get_or(*it, "languageIds", provider.languageIds);
        v.compileProvider = std::move(provider);
    }
    get_or(j, "dependencySourcesProvider", v.dependencySourcesProvider);
    get_or(j, "canReload", v.canReload);
    get_or(j, "buildTargetChangedProvider", v.buildTargetChangedProvider);
}

void to_json(json& j, const InitializeBuildResult& v) {
    j = json{{"displayName", v.displayName},
             {"version", v.version},
             {"bspVersion", v.bspVersion},
             {"capabilities", v.capabilities}};
    put_opt(j, "data", v.data);
}

void from_json(const json& j, InitializeBuildResult& v) {
    get_or(j, "displayName", v.displayName);
    get_or(j, "version", v.version);
    j.at("bspVersion").get_to(v.bspVersion);
    j.at("capabilities").get_to(v.capabilities);
    get_opt(j, "data", v.data);
}

// Workspace / target queries

void to_json(json& j, const WorkspaceBuildTargetsResult& v) {
    j = json{{"targets", v.targets}};
}

void from_json(const json& j, WorkspaceBuildTargetsResult& v) {
    j.at("targets").get_to(v.targets);
}

void to_json(json& j, const TargetsParams& v) {
    j = json{{"targets", v.targets}};
}

void from_json(const json& j, TargetsParams& v) {
    j.at("targets").get_to(v.targets);
}

void to_json(json& j, const ScalacOptionsItem& v) {
    j = json{{"target", v.target},
             {"options", v.options},
             {"classpath", v.classpath},
             {"classDirectory", v.classDirectory}};
}

void from_json(const json& j, ScalacOptionsItem& v) {
    j.at("target").get_to(v.target);
    get_or(j, "options", v.options);
    get_or(j, "classpath", v.classpath);
    get_or(j, "classDirectory", v.classDirectory);
}

void to_json(json& j, const ScalacOptionsResult& v) {
    j = json{{"items", v.items}};
}

void from_json(const json& j, ScalacOptionsResult& v) {
    j.at("items").get_to(v.items);
}

void to_json(json& j, const SourceItem& v) {
    j = json{{"uri", v.uri}, {"kind", static_cast<int>(v.kind)}, {"generated", v.generated}};
}

void from_json(const json& j, SourceItem& v) {
    j.at("uri").get_to(v.uri);
    get_enum(j, "kind", v.kind);
    get_or(j, "generated", v.generated);
}

void to_json(json& j, const SourcesItem& v) {
    j = json{{"target", v.target}, {"sources", v.sources}};
    if (!v.roots.empty()) {
        j["roots"] = v.roots;
    }
}

void from_json(const json& j, SourcesItem& v) {
    j.at("target").get_to(v.target);
    j.at("sources").get_to(v.sources);
    get_or(j, "roots", v.roots);
}

void to_json(json& j, const SourcesResult& v) {
    j = json{{"items", v.items}};
}

void from_json(const json& j, SourcesResult& v) {
    j.at("items").get_to(v.items);
}

void to_json(json& j, const DependencySourcesItem& v) {
    j = json{{"target", v.target}, {"sources", v.sources}};
}

void from_json(const json& j, DependencySourcesItem& v) {
    j.at("target").get_to(v.target);
    get_or(j, "sources", v.sources);
}

void to_json(json& j, const DependencySourcesResult& v) {
    j = json{{"items", v.items}};
}

void from_json(const json& j, DependencySourcesResult& v) {
    j.at("items").get_to(v.items);
}

// Compile

void to_json(json& j, const CompileParams& v) {
    j = json{{"targets", v.targets}};
    put_opt(j, "originId", v.originId);
    if (!v.arguments.empty()) {
        j["arguments"] = v.arguments;
    }
}

void from_json(const json& j, CompileParams& v) {
    j.at("targets").get_to(v.targets);
    get_opt(j, "originId", v.originId);
    get_or(j, "arguments", v.arguments);
}

void to_json(json& j, const CompileResult& v) {
    j = json{{"statusCode", static_cast<int>(v.statusCode)}};
    put_opt(j, "originId", v.originId);
    put_opt(j, "dataKind", v.dataKind);
    put_opt(j, "data", v.data);
}

void from_json(const json& j, CompileResult& v) {
    v.statusCode = static_cast<StatusCode>(j.at("statusCode").get<int>());
    get_opt(j, "originId", v.originId);
    get_opt(j, "dataKind", v.dataKind);
    get_opt(j, "data", v.data);
}

void to_json(json& j, const TaskId& v) {
    j = json{{"id", v.id}};
    if (!v.parents.empty()) {
        j["parents"] = v.parents;
    }
}

void from_json(const json& j, TaskId& v) {
    j.at("id").get_to(v.id);
    get_or(j, "parents", v.parents);
}

void to_json(json& j, const CompileTask& v) {
    j = json{{"target", v.target}};
}

void from_json(const json& j, CompileTask& v) {
    j.at("target").get_to(v.target);
}

void to_json(json& j, const CompileReport& v) {
    j = json{{"target", v.target},
             {"errors", v.errors},
             {"warnings", v.warnings},
             {"noOp", v.noOp}};
    put_opt(j, "originId", v.originId);
    put_opt(j, "time", v.time);
    put_opt(j, "analysisOut", v.analysisOut);
}

void from_json(const json& j, CompileReport& v) {
    j.at("target").get_to(v.target);
    get_or(j, "errors", v.errors);
    get_or(j, "warnings", v.warnings);
    get_or(j, "noOp", v.noOp);
    get_opt(j, "originId", v.originId);
    get_opt(j, "time", v.time);
    get_opt(j, "analysisOut", v.analysisOut);
}

// Task notifications

void to_json(json& j, const TaskStartParams& v) {
    j = json{{"taskId", v.taskId}};
    put_opt(j, "originId", v.originId);
    put_opt(j, "eventTime", v.eventTime);
    put_opt(j, "message", v.message);
    put_opt(j, "dataKind", v.dataKind);
    put_opt(j, "data", v.data);
}

void from_json(const json& j, TaskStartParams& v) {
    j.at("taskId").get_to(v.taskId);
    get_opt(j, "originId", v.originId);
    get_opt(j, "eventTime", v.eventTime);
    get_opt(j, "message", v.message);
    get_opt(j, "dataKind", v.dataKind);
    get_opt(j, "data", v.data);
}

void to_json(json& j, const TaskProgressParams& v) {
    j = json{{"taskId", v.taskId}};
    put_opt(j, "originId", v.originId);
    put_opt(j, "eventTime", v.eventTime);
    put_opt(j, "message", v.message);
    put_opt(j, "total", v.total);
    put_opt(j, "progress", v.progress);
    put_opt(j, "unit", v.unit);
    put_opt(j, "dataKind", v.dataKind);
    put_opt(j, "data", v.data);
}

void from_json(const json& j, TaskProgressParams& v) {
    j.at("taskId").get_to(v.taskId);
    get_opt(j, "originId", v.originId);
    get_opt(j, "eventTime", v.eventTime);
    get_opt(j, "message", v.message);
    get_opt(j, "total", v.total);
    get_opt(j, "progress", v.progress);
    get_opt(j, "unit", v.unit);
    get_opt(j, "dataKind", v.dataKind);
    get_opt(j, "data", v.data);
}

void to_json(json& j, const TaskFinishParams& v) {
    j = json{{"taskId", v.taskId}, {"status", static_cast<int>(v.status)}};
    put_opt(j, "eventTime", v.eventTime);
    put_opt(j, "message", v.message);
    put_opt(j, "dataKind", v.dataKind);
    put_opt(j, "data", v.data);
}

void from_json(const json& j, TaskFinishParams& v) {
    j.at("taskId").get_to(v.taskId);
    get_opt(j, "originId", v.originId);
    v.status = static_cast<StatusCode>(j.at("status").get<int>());
    get_opt(j, "eventTime", v.eventTime);
    get_opt(j, "message", v.message);
    get_opt(j, "dataKind", v.dataKind);
    get_opt(j, "data", v.data);
}

// Messages

void to_json(json& j, const LogMessageParams& v) {
    j = json{{"type", static_cast<int>(v.type)}, {"message", v.message}};
    put_opt(j, "task", v.task);
    put_opt(j, "originId", v.originId);
}

void from_json(const json& j, LogMessageParams& v) {
    v.type = static_cast<MessageType>(j.at("type").get<int>());
    j.at("message").get_to(v.message);
    get_opt(j, "task", v.task);
    get_opt(j, "originId", v.originId);
}

void to_json(json& j, const ShowMessageParams& v) {
    j = json{{"type", static_cast<int>(v.type)}, {"message", v.message}};
    put_opt(j, "task", v.task);
    put_opt(j, "originId", v.originId);
}

void from_json(const json& j, ShowMessageParams& v) {
    v.type = static_cast<MessageType>(j.at("type").get<int>());
    j.at("message").get_to(v.message);
    get_opt(j, "task", v.task);
    get_opt(j, "originId", v.originId);
}

// Diagnostics

void to_json(json& j, const Position& v) {
    j = json{{"line", v.line}, {"character", v.character}};
}

void from_json(const json& j, Position& v) {
    j.at("line").get_to(v.line);
    j.at("character").get_to(v.character);
}

void to_json(json& j, const Range& v) {
    j = json{{"start", v.start}, {"end", v.end}};
}

void from_json(const json& j, Range& v) {
    j.at("start").get_to(v.start);
    j.at("end").get_to(v.end);
}

void to_json(json& j, const Diagnostic& v) {
    j = json{{"range", v.range}, {"message", v.message}};
    if (v.severity) {
        j["severity"] = static_cast<int>(*v.severity);
    }
    put_opt(j, "code", v.code);
    put_opt(j, "source", v.source);
}

void from_json(const json& j, Diagnostic& v) {
    j.at("range").get_to(v.range);
    j.at("message").get_to(v.message);
    if (auto it = j.find("severity"); it != j.end() && !it->is_null()) {
        v.severity = static_cast<DiagnosticSeverity>(it->get<int>());
    }
    get_opt(j, "code", v.code);
    get_opt(j, "source", v.source);
}

void to_json(json& j, const PublishDiagnosticsParams& v) {
    j = json{{"textDocument", json{{"uri", v.textDocument}}},
             {"buildTarget", v.buildTarget},
             {"diagnostics", v.diagnostics},
             {"reset", v.reset}};
    put_opt(j, "originId", v.originId);
}

void from_json(const json& j, PublishDiagnosticsParams& v) {
    j.at("textDocument").at("uri").get_to(v.textDocument);
    j.at("buildTarget").get_to(v.buildTarget);
    get_or(j, "diagnostics", v.diagnostics);
    get_or(j, "reset", v.reset);
    get_opt(j, "originId", v.originId);
}

void to_json(json& j, const BuildTargetEvent& v) {
    j = json{{"target", v.target}};
    if (v.kind) {
        j["kind"] = static_cast<int>(*v.kind);
    }
}

void from_json(const json& j, BuildTargetEvent& v) {
    j.at("target").get_to(v.target);
    if (auto it = j.find("kind"); it != j.end() && !it->is_null()) {
        v.kind = static_cast<BuildTargetEventKind>(it->get<int>());
    }
}

void to_json(json& j, const DidChangeBuildTarget& v) {
    j = json{{"changes", v.changes}};
}

void from_json(const json& j, DidChangeBuildTarget& v) {
    j.at("changes").get_to(v.changes);
}

} // namespace bsplink::ipc
