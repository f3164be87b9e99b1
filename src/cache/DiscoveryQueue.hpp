#pragma once
#include <deque>
#include "../core/Types.hpp"

namespace ClipRelay {
    // Pending identifiers awaiting download. Never evicts: callers check
    // HasRoom() before pushing.
    class DiscoveryQueue {
    public:
        explicit DiscoveryQueue(size_t capacity);

        void Push(ContentRef ref); // throws std::logic_error when full
        ContentRef Pop();          // throws QueueEmpty

        bool HasRoom() const { return items_.size() < capacity_; }
        bool Empty() const { return items_.empty(); }
        bool Contains(const ContentRef& ref) const;
        size_t Size() const { return items_.size(); }
        size_t Capacity() const { return capacity_; }

    private:
        size_t capacity_;
        std::deque<ContentRef> items_;
    };
}
