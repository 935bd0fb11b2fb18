#include <bsplink/client/analysis_reader.h>
#include <bsplink/core/format.h>
#include <bsplink/server/compile_engine.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <string_view>

namespace bsplink::server {

using nlohmann::json;

namespace {

constexpr std::string_view kErrorMarker = "bsplink:error";
constexpr std::string_view kWarningMarker = "bsplink:warning";
constexpr const char* kManifestName = ".bsplink-manifest.json";

std::string trim(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r");
    return std::string(text.substr(start, end - start + 1));
}

void scan_markers(const std::filesystem::path& file, std::istream& in, CompileOutput& out) {
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        for (auto [marker, severity] :
             {std::pair{kErrorMarker, ipc::DiagnosticSeverity::Error},
              std::pair{kWarningMarker, ipc::DiagnosticSeverity::Warning}}) {
            auto pos = line.find(marker);
            if (pos == std::string::npos) {
                continue;
            }
            FileDiagnostic d;
            d.file = file;
            d.diagnostic.range.start = {lineNo, static_cast<int>(pos)};
            d.diagnostic.range.end = {lineNo, static_cast<int>(line.size())};
            d.diagnostic.severity = severity;
            d.diagnostic.source = "bsplink";
            auto message = trim(std::string_view(line).substr(pos + marker.size()));
            d.diagnostic.message = message.empty() ? std::string(marker) : message;
            if (severity == ipc::DiagnosticSeverity::Error) {
                ++out.errors;
            } else {
                ++out.warnings;
            }
            out.diagnostics.push_back(std::move(d));
            break;
        }
        ++lineNo;
    }
}

Result<void> write_file(const std::filesystem::path& path, std::string_view bytes) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::InternalError,
                     bsplink::format("create {}: {}", path.parent_path().string(), ec.message())};
    }
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::InternalError, bsplink::format("cannot write {}", tmp.string())};
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return Error{ErrorCode::InternalError, bsplink::format("short write to {}", tmp.string())};
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return Error{ErrorCode::InternalError,
                     bsplink::format("rename to {}: {}", path.string(), ec.message())};
    }
    return Result<void>();
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return {};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

Result<CompileOutput> ManifestCompileEngine::compile(const CompileInputs& inputs) {
    const auto started = std::chrono::steady_clock::now();
    CompileOutput out;

    json manifest;
    manifest["target"] = inputs.target.uri;
    manifest["name"] = inputs.name;
    manifest["classpath"] = inputs.classpath;
    manifest["options"] = inputs.options;
    manifest["sources"] = json::array();

    for (const auto& source : inputs.sources) {
        if (inputs.cancelled && inputs.cancelled()) {
            out.status = ipc::StatusCode::Cancelled;
            return out;
        }
        std::error_code ec;
        if (std::filesystem::is_directory(source, ec)) {
            continue;
        }
        std::ifstream in(source);
        if (!in) {
            FileDiagnostic d;
            d.file = source;
            d.diagnostic.severity = ipc::DiagnosticSeverity::Error;
            d.diagnostic.source = "bsplink";
            d.diagnostic.message = bsplink::format("source file not found: {}", source.string());
            out.diagnostics.push_back(std::move(d));
            ++out.errors;
            continue;
        }
        scan_markers(source, in, out);

        std::error_code sizeEc;
        std::error_code timeEc;
        auto size = std::filesystem::file_size(source, sizeEc);
        auto mtime = std::filesystem::last_write_time(source, timeEc);
        manifest["sources"].push_back(
            {{"path", source.string()},
             {"size", sizeEc ? uint64_t{0} : static_cast<uint64_t>(size)},
             {"mtime", timeEc ? int64_t{0}
                              : static_cast<int64_t>(mtime.time_since_epoch().count())}});
    }

    if (out.errors > 0) {
        out.status = ipc::StatusCode::Error;
        out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        return out;
    }

    const auto payload = manifest.dump();
    const auto manifestPath = inputs.classesDir / kManifestName;
    out.noOp = read_text(manifestPath) == payload;
    if (!out.noOp) {
        if (auto written = write_file(manifestPath, payload); !written) {
            return written.error();
        }
    }
    if (!inputs.analysisOut.empty()) {
        if (auto written = write_file(inputs.analysisOut, client::encode_analysis(payload));
            !written) {
            return written.error();
        }
        out.analysis = inputs.analysisOut;
    }

    out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::debug("Compiled {} ({} source(s), {} warning(s){})", inputs.name,
                  manifest["sources"].size(), out.warnings, out.noOp ? ", no-op" : "");
    return out;
}

} // namespace bsplink::server
