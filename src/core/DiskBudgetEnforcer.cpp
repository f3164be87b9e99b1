#include "DiskBudgetEnforcer.hpp"
#include "../utils/Logger.hpp"

namespace ClipRelay {

DiskBudget DiskBudget::FromMegabytes(std::uint64_t quota_mb, std::uint64_t reserve_mb) {
    DiskBudget b;
    b.quota_bytes = quota_mb * 1024 * 1024;
    b.reserve_bytes = reserve_mb * 1024 * 1024;
    return b;
}

DiskBudgetEnforcer::DiskBudgetEnforcer(DiskBudget budget, IDiskSpaceProbe& probe)
    : budget_(budget), probe_(probe) {}

bool DiskBudgetEnforcer::ConstraintsMet(const ArtifactStore& store) {
    if (store.TrackedBytes() > budget_.quota_bytes) return false;
    auto free_bytes = probe_.FreeBytes(store.Directory());
    if (!free_bytes) {
        Logger::Log(LogLevel::Debug, "Free space unknown for " + store.Directory().string() + ", checking quota only");
        return true;
    }
    return *free_bytes >= budget_.reserve_bytes;
}

EnforceReport DiskBudgetEnforcer::Enforce(PipelineState& state) {
    EnforceReport report;
    report.swept = state.SweepUntracked();

    int iterations = 0;
    while (!ConstraintsMet(state.store)) {
        if (++iterations > budget_.max_iterations) {
            Logger::Log(LogLevel::Warn, "Disk janitor safety stop hit after " + std::to_string(budget_.max_iterations) + " iterations.");
            report.safety_stop = true;
            return report;
        }
        if (!ReclaimOne(state)) {
            Logger::Log(LogLevel::Warn, "Disk budget cannot be satisfied: nothing left to delete in " + state.store.Directory().string());
            return report;
        }
        ++report.reclaimed;
    }
    report.satisfied = true;
    return report;
}

bool DiskBudgetEnforcer::ReclaimOne(PipelineState& state) {
    if (!state.history.Empty()) {
        if (auto freed = state.history.ReclaimOne()) {
            Logger::Log(LogLevel::Info, "Disk budget: evicted history entry " + freed->string());
            return true;
        }
    }

    if (!state.ready.Empty()) {
        Artifact oldest = state.ready.Pop();
        PathSet keep = state.ProtectedPaths();
        if (!keep.count(ArtifactStore::Key(oldest.path))) {
            state.store.Discard(oldest.path);
        }
        Logger::Log(LogLevel::Info, "Disk budget: evicted ready artifact " + oldest.path.string());
        return true;
    }

    if (auto stray = state.store.OldestUnprotected(state.ProtectedPaths())) {
        state.store.Discard(*stray);
        Logger::Log(LogLevel::Info, "Disk budget: removed untracked file " + stray->string());
        return true;
    }
    return false;
}

}
