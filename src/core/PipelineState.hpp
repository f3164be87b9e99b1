#pragma once
#include <mutex>
#include "../cache/ArtifactStore.hpp"
#include "../cache/DiscoveryQueue.hpp"
#include "../cache/HistoryLog.hpp"
#include "../cache/ReadyCache.hpp"
#include "../cache/SeenUrlTracker.hpp"

namespace ClipRelay {
    struct PipelineLimits {
        size_t queue_capacity = 3;
        size_t cache_capacity = 3;
        size_t history_capacity = 3;
        size_t seen_capacity = 250;
    };

    // The single owner of every bounded container. All members are mutated
    // only while `mutex` is held; long-running work happens outside it.
    class PipelineState {
    public:
        PipelineState(const PipelineLimits& limits, const std::filesystem::path& output_dir);

        PipelineState(const PipelineState&) = delete;
        PipelineState& operator=(const PipelineState&) = delete;

        // Files referenced by the ready cache, the history or an in-flight download.
        PathSet ProtectedPaths() const;

        void BeginTransfer(const std::filesystem::path& target);
        void EndTransfer(const std::filesystem::path& target);

        size_t SweepUntracked();

        std::mutex mutex;
        ArtifactStore store;
        SeenUrlTracker seen;
        DiscoveryQueue queue;
        ReadyCache ready;
        HistoryLog history;

    private:
        PathSet in_flight_;
    };
}
