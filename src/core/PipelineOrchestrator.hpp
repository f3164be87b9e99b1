#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "DiskBudgetEnforcer.hpp"
#include "JobScheduler.hpp"
#include "PipelineState.hpp"
#include "RuntimeRecycler.hpp"
#include "../interfaces/IArtifactDownloader.hpp"
#include "../interfaces/IContentDiscoverer.hpp"
#include "../interfaces/IMetadataExtractor.hpp"

namespace ClipRelay {
    struct OrchestratorOptions {
        std::string homepage_url = "https://www.tiktok.com/";
        std::chrono::seconds serve_metadata_timeout{8};
        int download_attempts = 2;  // Timeout/Transient failures are retried
        int next_attempts = 3;      // queued identifiers tried by Next() on an empty cache
        size_t ready_low_water = 1;
        std::chrono::milliseconds refill_interval{1000};
        std::chrono::milliseconds refill_backoff{5000};
        std::chrono::seconds maintenance_interval{180};
    };

    enum class NavStatus {
        Ok,
        NotFound,   // nothing left to serve
        Boundary,   // already at the oldest entry
        Failed,     // downloads failed for every candidate
        Stopped     // shutting down
    };

    struct NavigationResult {
        NavStatus status = NavStatus::Failed;
        std::optional<Artifact> artifact;
        int index = -1;
        std::string message;

        bool Ok() const { return status == NavStatus::Ok; }
    };

    // Drives discovery -> download -> cache -> serve -> evict and answers
    // navigation requests. Every collaborator call runs outside the state lock.
    class PipelineOrchestrator {
    public:
        using MaintenanceStep = std::function<void()>;

        PipelineOrchestrator(PipelineState& state,
                             IContentDiscoverer& discoverer,
                             IArtifactDownloader& downloader,
                             IMetadataExtractor& extractor,
                             RuntimeRecycler& recycler,
                             DiskBudgetEnforcer& enforcer,
                             OrchestratorOptions options);

        // Launches the browser, fills the queue, serves the first item and keeps a
        // second one ready. Throws PipelineError(Fatal) when that cannot be done.
        void Startup();

        NavigationResult Next();
        NavigationResult Previous();
        NavigationResult Current();

        // Stored metadata, extracted lazily when missing.
        std::optional<VideoMetadata> ResolveMetadata(const Artifact& artifact);

        size_t FillDiscoveryQueue(size_t target);
        bool RefillOnce();
        void MaintenanceOnce();
        void AddMaintenanceStep(std::string name, MaintenanceStep step);

        void ScheduleBackgroundTasks(JobScheduler& scheduler);
        void Shutdown();
        bool AcceptingWork() const { return accepting_.load(); }

    private:
        enum class Destination { Ready, History };

        bool DiscoverIntoQueue();
        DownloadResult DownloadWithRetry(const ContentRef& ref);
        DownloadResult Transfer(const ContentRef& ref, Destination destination);
        NavigationResult SnapshotUnlocked(NavStatus status) const;
        void RunMaintenanceStep(const std::string& name, const MaintenanceStep& step);
        void ScheduleRefill(std::chrono::milliseconds delay);
        void ScheduleMaintenance();

        PipelineState& state_;
        IContentDiscoverer& discoverer_;
        IArtifactDownloader& downloader_;
        IMetadataExtractor& extractor_;
        RuntimeRecycler& recycler_;
        DiskBudgetEnforcer& enforcer_;
        OrchestratorOptions options_;

        std::mutex session_mutex_; // serializes discovery and browser recycling
        std::atomic<bool> accepting_{true};
        std::atomic<bool> shut_down_{false};
        JobScheduler* scheduler_ = nullptr;
        std::vector<std::pair<std::string, MaintenanceStep>> extra_steps_;
    };
}
