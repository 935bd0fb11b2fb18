#include <bsplink/client/compile_result_cache.h>
#include <bsplink/core/format.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace bsplink::client {

using Clock = std::chrono::steady_clock;

namespace {

std::optional<Clock::time_point> deadline_for(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return std::nullopt;
    }
    return Clock::now() + timeout;
}

bool is_ready(const PendingAnalysis& analysis) {
    return analysis.valid() &&
           analysis.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

AnalysisDecoder pooled_decoder(std::shared_ptr<ipc::ThreadPool> pool,
                               std::shared_ptr<IAnalysisReader> reader) {
    return [pool = std::move(pool), reader = std::move(reader)](
               const std::filesystem::path& location) -> PendingAnalysis {
        try {
            return pool
                ->submit([reader, location]() -> Result<std::optional<AnalysisContents>> {
                    try {
                        return reader->read(location);
                    } catch (const std::exception& e) {
                        return Error{ErrorCode::DecodeFailed,
                                     bsplink::format("decoding {} failed: {}", location.string(),
                                                     e.what())};
                    }
                })
                .share();
        } catch (const std::exception& e) {
            std::promise<Result<std::optional<AnalysisContents>>> failed;
            failed.set_value(Error{ErrorCode::DecodeFailed, e.what()});
            return failed.get_future().share();
        }
    };
}

CompileResultCache::CompileResultCache(AnalysisDecoder decoder, CompileResultCacheOptions options)
    : decoder_(std::move(decoder)), options_(options) {}

CompileResultCache::~CompileResultCache() = default;

CompileResultCache::Request& CompileResultCache::request_locked(const std::string& originId) {
    return requests_[originId];
}

CompileResultCache::Entry& CompileResultCache::entry_locked(const std::string& originId,
                                                            const BuildTargetIdentifier& target) {
    auto& entries = request_locked(originId).entries;
    auto [it, inserted] = entries.try_emplace(target);
    if (inserted) {
        it->second.serial = ++clock_;
    }
    return it->second;
}

CompileResultCache::Entry* CompileResultCache::find_locked(const std::string& originId,
                                                           const BuildTargetIdentifier& target) {
    auto it = requests_.find(originId);
    if (it == requests_.end()) {
        return nullptr;
    }
    auto eit = it->second.entries.find(target);
    return eit == it->second.entries.end() ? nullptr : &eit->second;
}

Result<void> CompileResultCache::beginRequest(const std::string& originId) {
    if (originId.empty()) {
        return Error{ErrorCode::InvalidArgument, "originId must not be empty"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = requests_.find(originId); it != requests_.end()) {
        if (it->second.phase == RequestPhase::Active) {
            return Error{ErrorCode::InvalidArgument,
                         bsplink::format("originId '{}' is already in flight", originId)};
        }
        spdlog::debug("CompileResultCache: originId '{}' reused, dropping {} previous entries",
                      originId, it->second.entries.size());
        release_locked(it->second);
        requests_.erase(it);
    }
    requests_.emplace(originId, Request{});
    cv_.notify_all();
    return Result<void>();
}

void CompileResultCache::markStarted(const std::string& originId,
                                     const BuildTargetIdentifier& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entry_locked(originId, target);
    entry.started = true;
    entry.lastUse = ++clock_;
}

void CompileResultCache::appendDiagnostics(const std::string& originId,
                                           const BuildTargetIdentifier& target,
                                           const std::string& uri,
                                           const std::vector<ipc::Diagnostic>& diagnostics,
                                           bool reset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entry_locked(originId, target);
    if (reset) {
        std::erase_if(entry.diagnostics, [&](const TargetDiagnostic& d) { return d.uri == uri; });
    }
    for (const auto& diagnostic : diagnostics) {
        entry.diagnostics.push_back(TargetDiagnostic{uri, diagnostic});
    }
}

Result<void> CompileResultCache::publish(const std::string& originId, CompileOutcome outcome,
                                         std::optional<PendingAnalysis> analysis) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entry_locked(originId, outcome.target);
    if (!entry.started) {
        spdlog::warn("CompileResultCache: finish without start for '{}' in '{}'",
                     outcome.target.uri, originId);
        return Error{ErrorCode::InvalidState,
                     bsplink::format("task for {} finished before it started", outcome.target.uri)};
    }
    if (entry.outcome) {
        spdlog::warn("CompileResultCache: duplicate outcome for '{}' in '{}' ({} kept, {} ignored)",
                     outcome.target.uri, originId, ipc::to_string(entry.outcome->status),
                     ipc::to_string(outcome.status));
        return Error{ErrorCode::InvalidState,
                     bsplink::format("outcome for {} already published", outcome.target.uri)};
    }

    outcome.originId = originId;
    outcome.diagnostics.clear();
    entry.outcome = std::move(outcome);
    entry.analysis = std::move(analysis);
    entry.lastUse = ++clock_;

    account_locked();
    reclaim_locked();
    cv_.notify_all();
    return Result<void>();
}

void CompileResultCache::completeRequest(const std::string& originId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(originId);
    if (it == requests_.end() || it->second.phase != RequestPhase::Active) {
        return;
    }
    it->second.phase = RequestPhase::Completed;
    cv_.notify_all();
}

void CompileResultCache::cancelRequest(const std::string& originId) {
    failRequest(originId, Error{ErrorCode::OperationCancelled,
                                bsplink::format("compile '{}' was cancelled", originId)});
}

void CompileResultCache::failRequest(const std::string& originId, const Error& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(originId);
    if (it == requests_.end() || it->second.phase != RequestPhase::Active) {
        return;
    }
    it->second.phase = reason.code == ErrorCode::OperationCancelled ? RequestPhase::Cancelled
                                                                    : RequestPhase::Abandoned;
    it->second.terminal = reason;
    cv_.notify_all();
}

void CompileResultCache::abandonActive(const Error& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t abandoned = 0;
    for (auto& [origin, request] : requests_) {
        if (request.phase == RequestPhase::Active) {
            request.phase = RequestPhase::Abandoned;
            request.terminal = Error{ErrorCode::ConnectionLost, reason.message};
            ++abandoned;
        }
    }
    if (abandoned > 0) {
        spdlog::debug("CompileResultCache: abandoned {} in-flight request(s): {}", abandoned,
                      reason.message);
        cv_.notify_all();
    }
}

void CompileResultCache::evict(const std::string& originId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(originId);
    if (it == requests_.end()) {
        return;
    }
    release_locked(it->second);
    requests_.erase(it);
    cv_.notify_all();
}

void CompileResultCache::release_locked(Request& request) {
    for (auto& [target, entry] : request.entries) {
        decodedBytes_ -= std::min(decodedBytes_, entry.accountedBytes);
        entry.accountedBytes = 0;
    }
}

void CompileResultCache::account_locked() {
    for (auto& [origin, request] : requests_) {
        for (auto& [target, entry] : request.entries) {
            if (entry.accounted || !entry.analysis || !is_ready(*entry.analysis)) {
                continue;
            }
            entry.accounted = true;
            const auto& decoded = entry.analysis->get();
            if (decoded && decoded.value()) {
                entry.accountedBytes = decoded.value()->sizeBytes();
                decodedBytes_ += entry.accountedBytes;
            }
        }
    }
}

void CompileResultCache::reclaim_locked() {
    if (options_.maxDecodedBytes == 0) {
        return;
    }
    while (decodedBytes_ > options_.maxDecodedBytes) {
        Entry* victim = nullptr;
        for (auto& [origin, request] : requests_) {
            for (auto& [target, entry] : request.entries) {
                if (entry.accountedBytes == 0 || entry.waiters > 0 || !entry.outcome ||
                    !entry.outcome->analysisLocation) {
                    continue;
                }
                if (!victim || entry.lastUse < victim->lastUse) {
                    victim = &entry;
                }
            }
        }
        if (!victim) {
            break;
        }
        spdlog::debug("CompileResultCache: dropping decoded analysis of {} ({} bytes)",
                      victim->outcome->target.uri, victim->accountedBytes);
        decodedBytes_ -= victim->accountedBytes;
        victim->accountedBytes = 0;
        victim->accounted = false;
        victim->analysis.reset();
        victim->reclaimed = true;
        ++reclaimed_;
    }
}

CompileResultCache::Probe CompileResultCache::probe_locked(const std::string& originId,
                                                           const BuildTargetIdentifier& target,
                                                           bool wantAnalysis) {
    Probe probe;
    auto it = requests_.find(originId);
    if (it == requests_.end()) {
        probe.kind = Probe::Kind::Failed;
        probe.error = Error{ErrorCode::NotFound,
                            bsplink::format("no compile with originId '{}'", originId)};
        return probe;
    }
    auto& request = it->second;
    if (auto eit = request.entries.find(target);
        eit != request.entries.end() && eit->second.outcome) {
        auto& entry = eit->second;
        entry.lastUse = ++clock_;
        probe.kind = Probe::Kind::Published;
        if (!wantAnalysis) {
            probe.outcome = entry.outcome;
            probe.outcome->diagnostics = entry.diagnostics;
            return probe;
        }
        if (!entry.analysis && entry.outcome->analysisLocation && decoder_) {
            // Reclaimed earlier, or published before a decoder was available
            entry.analysis = decoder_(*entry.outcome->analysisLocation);
            entry.accounted = false;
            if (entry.reclaimed) {
                entry.reclaimed = false;
                ++redecoded_;
            }
        }
        probe.analysis = entry.analysis;
        return probe;
    }

    switch (request.phase) {
        case RequestPhase::Active:
            probe.kind = Probe::Kind::Waiting;
            break;
        case RequestPhase::Completed:
            probe.kind = Probe::Kind::Failed;
            probe.error = Error{ErrorCode::NotFound,
                                bsplink::format("compile '{}' produced no outcome for {}",
                                                originId, target.uri)};
            break;
        case RequestPhase::Cancelled:
        case RequestPhase::Abandoned:
            probe.kind = Probe::Kind::Failed;
            probe.error = request.terminal;
            break;
    }
    return probe;
}

template <typename Pred>
bool CompileResultCache::wait_locked(std::unique_lock<std::mutex>& lock,
                                     std::optional<Clock::time_point> deadline, Pred pred) {
    while (!pred()) {
        if (!deadline) {
            cv_.wait(lock);
        } else if (cv_.wait_until(lock, *deadline) == std::cv_status::timeout) {
            return pred();
        }
    }
    return true;
}

Result<std::optional<AnalysisContents>>
CompileResultCache::await(const std::string& originId, const BuildTargetIdentifier& target,
                          std::chrono::milliseconds timeout) {
    auto deadline = deadline_for(timeout);
    std::unique_lock<std::mutex> lock(mutex_);

    Probe probe;
    bool settled = wait_locked(lock, deadline, [&] {
        probe = probe_locked(originId, target, true);
        return probe.kind != Probe::Kind::Waiting;
    });
    if (!settled) {
        return Error{ErrorCode::Timeout,
                     bsplink::format("no outcome for {} in '{}' after {}ms", target.uri, originId,
                                     timeout.count())};
    }
    if (probe.kind == Probe::Kind::Failed) {
        return probe.error;
    }
    if (!probe.analysis) {
        return std::optional<AnalysisContents>{};
    }

    // Pin the entry so memory pressure does not drop it while we wait
    uint64_t serial = 0;
    if (auto* entry = find_locked(originId, target)) {
        ++entry->waiters;
        serial = entry->serial;
    }
    auto pending = *probe.analysis;
    lock.unlock();

    bool ready = true;
    if (deadline) {
        ready = pending.wait_until(*deadline) == std::future_status::ready;
    } else {
        pending.wait();
    }

    lock.lock();
    if (auto* entry = find_locked(originId, target); entry && entry->serial == serial) {
        --entry->waiters;
    }
    if (!ready) {
        return Error{ErrorCode::Timeout, bsplink::format("decoding analysis of {} timed out after {}ms",
                                                         target.uri, timeout.count())};
    }
    account_locked();
    reclaim_locked();
    return pending.get();
}

Result<CompileOutcome> CompileResultCache::awaitOutcome(const std::string& originId,
                                                        const BuildTargetIdentifier& target,
                                                        std::chrono::milliseconds timeout) {
    auto deadline = deadline_for(timeout);
    std::unique_lock<std::mutex> lock(mutex_);

    Probe probe;
    bool settled = wait_locked(lock, deadline, [&] {
        probe = probe_locked(originId, target, false);
        return probe.kind != Probe::Kind::Waiting;
    });
    if (!settled) {
        return Error{ErrorCode::Timeout,
                     bsplink::format("no outcome for {} in '{}' after {}ms", target.uri, originId,
                                     timeout.count())};
    }
    if (probe.kind == Probe::Kind::Failed) {
        return probe.error;
    }
    return std::move(*probe.outcome);
}

boost::asio::awaitable<Result<std::optional<AnalysisContents>>>
CompileResultCache::await_async(std::string originId, BuildTargetIdentifier target,
                                std::chrono::milliseconds timeout) {
    using namespace std::chrono_literals;
    auto deadline = deadline_for(timeout);
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    auto expired = [&] { return deadline && Clock::now() >= *deadline; };

    Probe probe;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            probe = probe_locked(originId, target, true);
        }
        if (probe.kind != Probe::Kind::Waiting || expired()) {
            break;
        }
        timer.expires_after(10ms);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (probe.kind == Probe::Kind::Waiting) {
        co_return Error{ErrorCode::Timeout,
                        bsplink::format("no outcome for {} in '{}' after {}ms", target.uri,
                                        originId, timeout.count())};
    }
    if (probe.kind == Probe::Kind::Failed) {
        co_return probe.error;
    }
    if (!probe.analysis) {
        co_return std::optional<AnalysisContents>{};
    }

    uint64_t serial = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* entry = find_locked(originId, target)) {
            ++entry->waiters;
            serial = entry->serial;
        }
    }
    auto pending = *probe.analysis;
    while (!is_ready(pending) && !expired()) {
        timer.expires_after(10ms);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* entry = find_locked(originId, target); entry && entry->serial == serial) {
        --entry->waiters;
    }
    if (!is_ready(pending)) {
        co_return Error{ErrorCode::Timeout,
                        bsplink::format("decoding analysis of {} timed out after {}ms", target.uri,
                                        timeout.count())};
    }
    account_locked();
    reclaim_locked();
    co_return pending.get();
}

std::optional<CompileOutcome> CompileResultCache::outcome(const std::string& originId,
                                                          const BuildTargetIdentifier& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(originId);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    auto eit = it->second.entries.find(target);
    if (eit == it->second.entries.end() || !eit->second.outcome) {
        return std::nullopt;
    }
    auto result = eit->second.outcome;
    result->diagnostics = eit->second.diagnostics;
    return result;
}

std::vector<BuildTargetIdentifier> CompileResultCache::targets(const std::string& originId) const {
    std::vector<BuildTargetIdentifier> out;
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = requests_.find(originId); it != requests_.end()) {
        for (const auto& [target, entry] : it->second.entries) {
            if (entry.outcome) {
                out.push_back(target);
            }
        }
    }
    return out;
}

bool CompileResultCache::contains(const std::string& originId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.count(originId) > 0;
}

bool CompileResultCache::inFlight(const std::string& originId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(originId);
    return it != requests_.end() && it->second.phase == RequestPhase::Active;
}

CompileResultCacheStats CompileResultCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CompileResultCacheStats s;
    s.requests = requests_.size();
    for (const auto& [origin, request] : requests_) {
        s.entries += request.entries.size();
    }
    s.decodedBytes = decodedBytes_;
    s.reclaimed = reclaimed_;
    s.redecoded = redecoded_;
    return s;
}

} // namespace bsplink::client
