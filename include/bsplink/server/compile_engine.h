#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <bsplink/core/types.h>
#include <bsplink/ipc/bsp_protocol.h>

namespace bsplink::server {

struct CompileInputs {
    ipc::BuildTargetIdentifier target;
    std::string name;
    std::vector<std::filesystem::path> sources;
    std::vector<std::string> classpath;
    std::vector<std::string> options;
    std::filesystem::path classesDir;
    // Where the analysis is written on success
    std::filesystem::path analysisOut;
    // Polled between sources; true aborts with Cancelled status
    std::function<bool()> cancelled;
};

struct FileDiagnostic {
    std::filesystem::path file;
    ipc::Diagnostic diagnostic;
};

struct CompileOutput {
    ipc::StatusCode status{ipc::StatusCode::Ok};
    std::vector<FileDiagnostic> diagnostics;
    int errors{0};
    int warnings{0};
    bool noOp{false};
    // Set when the analysis was written
    std::optional<std::filesystem::path> analysis;
    std::chrono::milliseconds elapsed{0};
};

// Incremental compiler boundary. Called from compile pool threads, one call per target at a
// time; distinct targets may compile concurrently.
class ICompileEngine {
public:
    virtual ~ICompileEngine() = default;

    // A failure result means the engine itself could not run (I/O, setup). Compilation errors
    // are reported through CompileOutput.
    virtual Result<CompileOutput> compile(const CompileInputs& inputs) = 0;
};

/**
 * Engine that "compiles" by fingerprinting the inputs.
 *
 * Sources must exist and be readable; a missing one is an error diagnostic. Lines marked
 * "bsplink:error <message>" or "bsplink:warning <message>" produce diagnostics at that line.
 * On success the analysis file carries the input manifest, and the manifest is also kept in
 * the classes directory: compiling unchanged inputs again is a no-op.
 */
class ManifestCompileEngine : public ICompileEngine {
public:
    Result<CompileOutput> compile(const CompileInputs& inputs) override;
};

} // namespace bsplink::server
