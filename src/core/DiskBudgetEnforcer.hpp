#pragma once
#include <cstdint>
#include "PipelineState.hpp"
#include "../interfaces/IDiskSpaceProbe.hpp"

namespace ClipRelay {
    struct DiskBudget {
        std::uint64_t quota_bytes = 1024ull * 1024 * 1024;
        std::uint64_t reserve_bytes = 2048ull * 1024 * 1024;
        int max_iterations = 100;

        static DiskBudget FromMegabytes(std::uint64_t quota_mb, std::uint64_t reserve_mb);
    };

    struct EnforceReport {
        size_t swept = 0;       // untracked files removed by the initial sweep
        size_t reclaimed = 0;   // deletions made by the ladder
        bool satisfied = false;
        bool safety_stop = false;
    };

    // Brings the output directory under quota and above the free-space reserve,
    // one deletion at a time: history (never the current item while another
    // exists), then the ready cache, then the oldest unknown file.
    class DiskBudgetEnforcer {
    public:
        DiskBudgetEnforcer(DiskBudget budget, IDiskSpaceProbe& probe);

        // Caller holds state.mutex.
        EnforceReport Enforce(PipelineState& state);
        bool ConstraintsMet(const ArtifactStore& store);

        const DiskBudget& Budget() const { return budget_; }

    private:
        bool ReclaimOne(PipelineState& state);

        DiskBudget budget_;
        IDiskSpaceProbe& probe_;
    };
}
