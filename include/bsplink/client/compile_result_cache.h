#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <bsplink/client/analysis_reader.h>
#include <bsplink/core/types.h>
#include <bsplink/ipc/bsp_protocol.h>
#include <bsplink/ipc/thread_pool.h>

namespace bsplink::client {

using ipc::BuildTargetIdentifier;
using ipc::StatusCode;

using PendingAnalysis = std::shared_future<Result<std::optional<AnalysisContents>>>;

// Schedules decoding of an analysis location, normally on a worker pool.
using AnalysisDecoder = std::function<PendingAnalysis(const std::filesystem::path& location)>;

// Decode on the given pool with the given reader. A stopped pool yields an already failed
// PendingAnalysis.
AnalysisDecoder pooled_decoder(std::shared_ptr<ipc::ThreadPool> pool,
                               std::shared_ptr<IAnalysisReader> reader);

struct TargetDiagnostic {
    std::string uri;
    ipc::Diagnostic diagnostic;
};

struct CompileOutcome {
    BuildTargetIdentifier target;
    std::string originId;
    StatusCode status{StatusCode::Ok};
    std::vector<TargetDiagnostic> diagnostics;
    int errors{0};
    int warnings{0};
    bool noOp{false};
    std::optional<std::filesystem::path> analysisLocation;
};

struct CompileResultCacheOptions {
    // Upper bound for decoded analyses kept in memory. 0 disables the bound.
    std::size_t maxDecodedBytes{512 * 1024 * 1024};
};

struct CompileResultCacheStats {
    std::size_t requests{0};
    std::size_t entries{0};
    std::size_t decodedBytes{0};
    uint64_t reclaimed{0};
    uint64_t redecoded{0};
};

/**
 * Per-request, per-target store of compile outcomes fed by build notifications.
 *
 * Keys are (originId, target). An origin becomes known on beginRequest() or on the first
 * notification that references it, and stays until evict() or a later reuse of the same id.
 *
 * Awaiting callers block until the target's outcome is published and its analysis decoded,
 * or until the request reaches a terminal state without one:
 *   - completed  -> NotFound
 *   - cancelled  -> OperationCancelled
 *   - abandoned  -> the abandon reason (ConnectionLost)
 *
 * Decoded analyses are size-accounted. Above maxDecodedBytes the least recently used decoded
 * entries nobody is waiting on are dropped back to their on-disk location and decoded again
 * on the next await.
 *
 * Thread-safe.
 */
class CompileResultCache {
public:
    CompileResultCache(AnalysisDecoder decoder, CompileResultCacheOptions options = {});
    ~CompileResultCache();

    CompileResultCache(const CompileResultCache&) = delete;
    CompileResultCache& operator=(const CompileResultCache&) = delete;

    // Register a new logical request. InvalidArgument while the same origin is still in
    // flight; a finished origin is replaced and its entries dropped.
    Result<void> beginRequest(const std::string& originId);

    // Task start observed for the target.
    void markStarted(const std::string& originId, const BuildTargetIdentifier& target);

    void appendDiagnostics(const std::string& originId, const BuildTargetIdentifier& target,
                           const std::string& uri, const std::vector<ipc::Diagnostic>& diagnostics,
                           bool reset);

    // Publish the final outcome of a target. InvalidState when the task was never started or
    // an outcome already exists; the existing data is kept.
    Result<void> publish(const std::string& originId, CompileOutcome outcome,
                         std::optional<PendingAnalysis> analysis);

    // The compile call returned. Targets without an outcome resolve to NotFound, unless the
    // request was cancelled or abandoned before.
    void completeRequest(const std::string& originId);

    // Unpublished targets of the origin resolve to OperationCancelled. Published outcomes stay.
    void cancelRequest(const std::string& originId);

    // Unpublished targets of the origin resolve to the given error.
    void failRequest(const std::string& originId, const Error& reason);

    // Fail every request still in flight, e.g. when the connection is gone.
    void abandonActive(const Error& reason);

    // Drop all entries of an origin. In-flight decodes finish and their results are discarded.
    void evict(const std::string& originId);

    // Block until the analysis of (originId, target) is available. A non-positive timeout
    // waits without deadline.
    Result<std::optional<AnalysisContents>> await(const std::string& originId,
                                                  const BuildTargetIdentifier& target,
                                                  std::chrono::milliseconds timeout);

    // Block until the outcome of (originId, target) is published.
    Result<CompileOutcome> awaitOutcome(const std::string& originId,
                                        const BuildTargetIdentifier& target,
                                        std::chrono::milliseconds timeout);

    // Awaitable form of await(), polling on the caller's executor.
    boost::asio::awaitable<Result<std::optional<AnalysisContents>>>
    await_async(std::string originId, BuildTargetIdentifier target,
                std::chrono::milliseconds timeout);

    // Non-blocking lookups
    std::optional<CompileOutcome> outcome(const std::string& originId,
                                          const BuildTargetIdentifier& target) const;
    std::vector<BuildTargetIdentifier> targets(const std::string& originId) const;
    bool contains(const std::string& originId) const;
    bool inFlight(const std::string& originId) const;

    CompileResultCacheStats stats() const;

private:
    enum class RequestPhase { Active, Completed, Cancelled, Abandoned };

    struct Entry {
        bool started{false};
        std::optional<CompileOutcome> outcome;
        std::vector<TargetDiagnostic> diagnostics;
        std::optional<PendingAnalysis> analysis;
        std::size_t accountedBytes{0};
        bool accounted{false};
        bool reclaimed{false};
        uint64_t serial{0};
        int waiters{0};
        uint64_t lastUse{0};
    };

    struct Request {
        RequestPhase phase{RequestPhase::Active};
        Error terminal;
        std::map<BuildTargetIdentifier, Entry> entries;
    };

    // Outcome of a lookup under the lock
    struct Probe {
        enum class Kind { Waiting, Published, Failed } kind{Kind::Waiting};
        Error error;
        std::optional<PendingAnalysis> analysis;
        std::optional<CompileOutcome> outcome;
    };

    Request& request_locked(const std::string& originId);
    Entry& entry_locked(const std::string& originId, const BuildTargetIdentifier& target);
    Probe probe_locked(const std::string& originId, const BuildTargetIdentifier& target,
                       bool wantAnalysis);
    void release_locked(Request& request);
    void account_locked();
    void reclaim_locked();
    Entry* find_locked(const std::string& originId, const BuildTargetIdentifier& target);

    template <typename Pred>
    bool wait_locked(std::unique_lock<std::mutex>& lock,
                     std::optional<std::chrono::steady_clock::time_point> deadline, Pred pred);

    AnalysisDecoder decoder_;
    CompileResultCacheOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Request> requests_;
    std::size_t decodedBytes_{0};
    uint64_t clock_{0};
    uint64_t reclaimed_{0};
    uint64_t redecoded_{0};
};

} // namespace bsplink::client
