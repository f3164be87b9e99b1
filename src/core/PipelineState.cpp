#include "PipelineState.hpp"

namespace ClipRelay {

PipelineState::PipelineState(const PipelineLimits& limits, const std::filesystem::path& output_dir)
    : store(output_dir),
      seen(limits.seen_capacity),
      queue(limits.queue_capacity),
      ready(limits.cache_capacity, store),
      history(limits.history_capacity, store) {
    history.SetChangeHook([this]() { SweepUntracked(); });
}

PathSet PipelineState::ProtectedPaths() const {
    PathSet keep = in_flight_;
    for (const auto& p : history.Paths()) keep.insert(ArtifactStore::Key(p));
    for (const auto& p : ready.Paths()) keep.insert(ArtifactStore::Key(p));
    return keep;
}

void PipelineState::BeginTransfer(const std::filesystem::path& target) {
    if (!target.empty()) in_flight_.insert(ArtifactStore::Key(target));
}

void PipelineState::EndTransfer(const std::filesystem::path& target) {
    in_flight_.erase(ArtifactStore::Key(target));
}

size_t PipelineState::SweepUntracked() {
    return store.SweepUntracked(ProtectedPaths());
}

}
