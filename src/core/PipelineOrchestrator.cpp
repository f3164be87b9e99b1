#include "PipelineOrchestrator.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>

namespace ClipRelay {

namespace {
const char* kRefillJob = "refill";
const char* kMaintenanceJob = "maintenance";
}

PipelineOrchestrator::PipelineOrchestrator(PipelineState& state,
                                           IContentDiscoverer& discoverer,
                                           IArtifactDownloader& downloader,
                                           IMetadataExtractor& extractor,
                                           RuntimeRecycler& recycler,
                                           DiskBudgetEnforcer& enforcer,
                                           OrchestratorOptions options)
    : state_(state), discoverer_(discoverer), downloader_(downloader), extractor_(extractor),
      recycler_(recycler), enforcer_(enforcer), options_(std::move(options)) {}

void PipelineOrchestrator::Startup() {
    Logger::Log(LogLevel::Info, "Starting pipeline...");
    {
        std::lock_guard<std::mutex> session_lock(session_mutex_);
        recycler_.Launch();
    }

    size_t capacity = 0;
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        capacity = state_.queue.Capacity();
    }
    FillDiscoveryQueue(capacity);
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        if (state_.queue.Empty()) {
            throw PipelineError(ErrorKind::Fatal, "No videos queued at startup");
        }
        Logger::Log(LogLevel::Info, "Preloaded " + std::to_string(state_.queue.Size()) + " videos.");
    }

    bool served = false;
    while (!served) {
        ContentRef ref;
        {
            std::lock_guard<std::mutex> lock(state_.mutex);
            if (state_.queue.Empty()) break;
            ref = state_.queue.Pop();
        }
        served = Transfer(ref, Destination::History).Ok();
    }
    if (!served) {
        throw PipelineError(ErrorKind::Fatal, "Failed to download first video at startup");
    }

    std::optional<ContentRef> second;
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        if (!state_.queue.Empty()) second = state_.queue.Pop();
    }
    if (!second) {
        Logger::Log(LogLevel::Warn, "Not enough preloaded URLs to download second startup video");
    } else if (Transfer(*second, Destination::Ready).Ok()) {
        Logger::Log(LogLevel::Info, "Second video downloaded and kept ready for immediate 'Next'");
    } else {
        Logger::Log(LogLevel::Warn, "Failed to download second startup video");
    }

    FillDiscoveryQueue(1);

    std::lock_guard<std::mutex> lock(state_.mutex);
    enforcer_.Enforce(state_);
}

NavigationResult PipelineOrchestrator::Next() {
    if (!accepting_) {
        return {NavStatus::Stopped, std::nullopt, -1, "Shutting down"};
    }

    bool queue_drained = false;
    for (int attempt = 0; attempt <= options_.next_attempts; ++attempt) {
        ContentRef ref;
        {
            std::lock_guard<std::mutex> lock(state_.mutex);
            if (!state_.ready.Empty()) {
                Artifact next = state_.ready.Pop();
                Logger::Log(LogLevel::Info, "Moved ready video to played: " + next.path.string());
                state_.history.PushPlayed(std::move(next), true);
                return SnapshotUnlocked(NavStatus::Ok);
            }
            if (state_.queue.Empty() || attempt == options_.next_attempts) {
                queue_drained = state_.queue.Empty();
                break;
            }
            ref = state_.queue.Pop();
        }

        // Ready cache ran dry: fetch synchronously for this request.
        DownloadResult res = Transfer(ref, Destination::History);
        if (res.Ok()) {
            std::lock_guard<std::mutex> lock(state_.mutex);
            Logger::Log(LogLevel::Info, "Downloaded and moved to played for Next: " + res.artifact->path.string());
            return SnapshotUnlocked(NavStatus::Ok);
        }
        Logger::Log(LogLevel::Warn, "Failed to download fallback next video (" + std::string(ToString(res.kind)) + "): " + res.error);
    }

    if (queue_drained) {
        Logger::Log(LogLevel::Warn, "No video ready and no URL in queue for Next");
        return {NavStatus::NotFound, std::nullopt, -1, "Nothing available right now"};
    }
    return {NavStatus::Failed, std::nullopt, -1, "Could not fetch the next video"};
}

NavigationResult PipelineOrchestrator::Previous() {
    std::lock_guard<std::mutex> lock(state_.mutex);
    if (state_.history.Empty()) {
        return {NavStatus::NotFound, std::nullopt, -1, "Nothing has been played yet"};
    }
    if (!state_.history.MovePrevious()) {
        Logger::Log(LogLevel::Warn, "Already at the first video");
        NavigationResult res = SnapshotUnlocked(NavStatus::Boundary);
        res.message = "Already at the first video";
        return res;
    }
    Logger::Log(LogLevel::Info, "Moving to previous video at index " + std::to_string(state_.history.CurrentIndex()));
    return SnapshotUnlocked(NavStatus::Ok);
}

NavigationResult PipelineOrchestrator::Current() {
    std::lock_guard<std::mutex> lock(state_.mutex);
    if (state_.history.Empty()) {
        return {NavStatus::NotFound, std::nullopt, -1, "No current video"};
    }
    return SnapshotUnlocked(NavStatus::Ok);
}

NavigationResult PipelineOrchestrator::SnapshotUnlocked(NavStatus status) const {
    NavigationResult res;
    res.status = status;
    res.artifact = state_.history.Current();
    res.index = state_.history.CurrentIndex();
    return res;
}

std::optional<VideoMetadata> PipelineOrchestrator::ResolveMetadata(const Artifact& artifact) {
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        if (auto stored = state_.store.Metadata(artifact.path)) return stored;
    }

    ContentRef url = artifact.source;
    if (url.empty()) {
        url = UrlUtil::VideoPageUrl(options_.homepage_url, artifact.path.stem().string());
    }
    auto extracted = extractor_.Extract(url, options_.serve_metadata_timeout);
    VideoMetadata value = extracted ? *extracted : VideoMetadata{};

    std::lock_guard<std::mutex> lock(state_.mutex);
    // Metadata lives only as long as a container still holds the artifact.
    if (state_.ProtectedPaths().count(ArtifactStore::Key(artifact.path))) {
        state_.store.Remember(artifact.path, value);
    }
    return value;
}

size_t PipelineOrchestrator::FillDiscoveryQueue(size_t target) {
    size_t added = 0;
    while (accepting_) {
        {
            std::lock_guard<std::mutex> lock(state_.mutex);
            size_t goal = std::min(target, state_.queue.Capacity());
            if (state_.queue.Size() >= goal) break;
        }
        if (!DiscoverIntoQueue()) break;
        ++added;
    }
    return added;
}

bool PipelineOrchestrator::DiscoverIntoQueue() {
    std::lock_guard<std::mutex> session_lock(session_mutex_);

    auto is_seen = [this](const ContentRef& ref) {
        std::lock_guard<std::mutex> lock(state_.mutex);
        return state_.seen.IsSeen(ref) || state_.queue.Contains(ref);
    };

    DiscoveryResult res;
    try {
        res = discoverer_.DiscoverOne(is_seen);
    } catch (const PipelineError& e) {
        res.kind = e.Kind();
        res.error = e.what();
    } catch (const std::exception& e) {
        res.kind = ErrorKind::Transient;
        res.error = e.what();
    }
    if (!res.ref) {
        Logger::Log(res.kind == ErrorKind::Fatal ? LogLevel::Error : LogLevel::Warn,
                    "Discovery failed (" + std::string(ToString(res.kind)) + "): " + res.error);
        return false;
    }

    std::lock_guard<std::mutex> lock(state_.mutex);
    if (state_.seen.IsSeen(*res.ref)) {
        Logger::Log(LogLevel::Debug, "Discovered identifier already seen: " + *res.ref);
        return false;
    }
    state_.seen.MarkSeen(*res.ref);
    if (!state_.queue.HasRoom()) {
        Logger::Log(LogLevel::Debug, "Queue filled concurrently, dropping " + *res.ref);
        return true;
    }
    state_.queue.Push(*res.ref);
    recycler_.NotePreload();
    Logger::Log(LogLevel::Info, "Added new video URL to queue: " + *res.ref);
    return true;
}

DownloadResult PipelineOrchestrator::DownloadWithRetry(const ContentRef& ref) {
    DownloadResult res;
    const int attempts = std::max(1, options_.download_attempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            res = downloader_.Download(ref);
        } catch (const PipelineError& e) {
            res = DownloadResult{};
            res.kind = e.Kind();
            res.error = e.what();
        } catch (const std::exception& e) {
            res = DownloadResult{};
            res.kind = ErrorKind::Transient;
            res.error = e.what();
        }
        if (res.Ok()) return res;
        if (res.kind == ErrorKind::Rejected) {
            Logger::Log(LogLevel::Info, "Skipping " + ref + ": " + res.error);
            return res;
        }
        if (res.kind == ErrorKind::Fatal) return res;
        Logger::Log(LogLevel::Warn, "Download attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                    " failed for " + ref + " (" + ToString(res.kind) + "): " + res.error);
    }
    return res;
}

DownloadResult PipelineOrchestrator::Transfer(const ContentRef& ref, Destination destination) {
    const auto target = downloader_.TargetPath(ref);
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        state_.BeginTransfer(target);
    }

    DownloadResult res = DownloadWithRetry(ref);

    std::lock_guard<std::mutex> lock(state_.mutex);
    state_.EndTransfer(target);
    if (!res.Ok()) return res;

    Artifact artifact = *res.artifact;
    state_.store.Remember(artifact.path, res.metadata ? *res.metadata : VideoMetadata{});
    if (destination == Destination::Ready) {
        state_.ready.Push(artifact);
        Logger::Log(LogLevel::Info, "Added new video to ready cache: " + artifact.path.string());
    } else {
        state_.history.PushPlayed(artifact, true);
    }
    enforcer_.Enforce(state_);
    return res;
}

bool PipelineOrchestrator::RefillOnce() {
    if (!accepting_) return true;
    bool ok = true;

    std::optional<ContentRef> ref;
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        if (state_.ready.Size() < options_.ready_low_water && !state_.queue.Empty()) {
            ref = state_.queue.Pop();
        }
    }
    if (ref) {
        DownloadResult res = Transfer(*ref, Destination::Ready);
        if (res.Ok()) {
            Logger::Log(LogLevel::Info, "Pre-downloaded next video: " + res.artifact->path.string());
        } else if (res.kind != ErrorKind::Rejected) {
            ok = false;
        }
    }

    size_t capacity = 0;
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        capacity = state_.queue.Capacity();
    }
    FillDiscoveryQueue(capacity);
    {
        std::lock_guard<std::mutex> lock(state_.mutex);
        if (accepting_ && state_.queue.HasRoom()) ok = false;
    }
    return ok;
}

void PipelineOrchestrator::MaintenanceOnce() {
    RunMaintenanceStep("disk budget", [this]() {
        std::lock_guard<std::mutex> lock(state_.mutex);
        enforcer_.Enforce(state_);
    });
    RunMaintenanceStep("seen pruning", [this]() {
        std::lock_guard<std::mutex> lock(state_.mutex);
        state_.seen.PruneIfNeeded();
    });
    RunMaintenanceStep("browser recycle", [this]() {
        std::lock_guard<std::mutex> session_lock(session_mutex_);
        recycler_.RecycleIfNeeded();
    });
    for (const auto& step : extra_steps_) {
        RunMaintenanceStep(step.first, step.second);
    }
}

void PipelineOrchestrator::AddMaintenanceStep(std::string name, MaintenanceStep step) {
    extra_steps_.emplace_back(std::move(name), std::move(step));
}

void PipelineOrchestrator::RunMaintenanceStep(const std::string& name, const MaintenanceStep& step) {
    try {
        step();
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Maintenance step '" + name + "' failed: " + e.what());
    }
}

void PipelineOrchestrator::ScheduleBackgroundTasks(JobScheduler& scheduler) {
    scheduler_ = &scheduler;
    ScheduleRefill(options_.refill_interval);
    ScheduleMaintenance();
}

void PipelineOrchestrator::ScheduleRefill(std::chrono::milliseconds delay) {
    if (!scheduler_ || !accepting_) return;
    scheduler_->Schedule(kRefillJob, delay, [this]() {
        bool ok = false;
        try {
            ok = RefillOnce();
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Warn, "Pre-download task failed: " + std::string(e.what()));
        }
        ScheduleRefill(ok ? options_.refill_interval : options_.refill_backoff);
    });
}

void PipelineOrchestrator::ScheduleMaintenance() {
    if (!scheduler_ || !accepting_) return;
    scheduler_->Schedule(kMaintenanceJob, options_.maintenance_interval, [this]() {
        MaintenanceOnce();
        ScheduleMaintenance();
    });
}

void PipelineOrchestrator::Shutdown() {
    if (shut_down_.exchange(true)) return;

    accepting_ = false;
    if (scheduler_) {
        scheduler_->Cancel(kRefillJob);
        scheduler_->Cancel(kMaintenanceJob);
    }
    Logger::Log(LogLevel::Info, "Pipeline stopped accepting work");

    try {
        std::lock_guard<std::mutex> lock(state_.mutex);
        size_t removed = state_.SweepUntracked();
        Logger::Log(LogLevel::Info, "Final cleanup removed " + std::to_string(removed) + " stray file(s)");
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Final cleanup failed: " + std::string(e.what()));
    }

    try {
        std::lock_guard<std::mutex> session_lock(session_mutex_);
        recycler_.Teardown();
        Logger::Log(LogLevel::Info, "Browser session closed");
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Failed to close browser session: " + std::string(e.what()));
    }
}

}
