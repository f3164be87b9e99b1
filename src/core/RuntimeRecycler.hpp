#pragma once
#include <atomic>
#include <chrono>
#include "../interfaces/IMemoryProbe.hpp"
#include "../interfaces/IRuntimeSession.hpp"

namespace ClipRelay {
    enum class RecycleReason {
        None,
        PreloadThreshold,
        MemoryLimit
    };

    struct RecyclePolicy {
        int restart_preload_threshold = 200; // 0 disables the counter check
        long memory_soft_limit_mb = 1200;    // 0 disables the memory check
        std::chrono::milliseconds settle_delay{500};
    };

    // Owns the browser session lifecycle and restarts it after too many
    // preloads or when its resident memory grows past the soft limit.
    class RuntimeRecycler {
    public:
        RuntimeRecycler(IRuntimeSession& session, IMemoryProbe& probe, RecyclePolicy policy);

        // Starts the session and applies credentials. Throws PipelineError(Fatal).
        void Launch();
        void Teardown();

        void NotePreload() { ++preload_counter_; }
        int PreloadCount() const { return preload_counter_.load(); }

        RecycleReason Evaluate();
        // Returns true when the session was restarted.
        bool RecycleIfNeeded();

    private:
        IRuntimeSession& session_;
        IMemoryProbe& probe_;
        RecyclePolicy policy_;
        std::atomic<int> preload_counter_{0};
    };
}
