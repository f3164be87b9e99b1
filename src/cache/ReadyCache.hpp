#pragma once
#include <deque>
#include <vector>
#include "ArtifactStore.hpp"

namespace ClipRelay {
    // Downloaded artifacts ready to serve. Pushing at capacity ages out the
    // oldest entry: its file is deleted and its metadata purged.
    class ReadyCache {
    public:
        ReadyCache(size_t capacity, ArtifactStore& store);

        void Push(Artifact artifact);
        Artifact Pop(); // throws QueueEmpty

        bool Empty() const { return items_.empty(); }
        size_t Size() const { return items_.size(); }
        size_t Capacity() const { return capacity_; }
        std::vector<std::filesystem::path> Paths() const;

    private:
        size_t capacity_;
        ArtifactStore& store_;
        std::deque<Artifact> items_;
    };
}
