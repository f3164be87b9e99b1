#pragma once
#include <deque>
#include <string>
#include <unordered_set>
#include "../core/Types.hpp"

namespace ClipRelay {
    // Bounded recency window over discovered identifiers. Entries leave in
    // insertion order; lookups do not refresh them.
    class SeenUrlTracker {
    public:
        explicit SeenUrlTracker(size_t capacity);

        void MarkSeen(const ContentRef& ref);
        bool IsSeen(const ContentRef& ref) const;
        void PruneIfNeeded();

        size_t Size() const { return order_.size(); }
        size_t Capacity() const { return capacity_; }

    private:
        void EvictOldest();

        size_t capacity_;
        std::unordered_set<ContentRef> members_;
        std::deque<ContentRef> order_;
    };
}
