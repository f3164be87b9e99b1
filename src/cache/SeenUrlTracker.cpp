#include "SeenUrlTracker.hpp"

namespace ClipRelay {

SeenUrlTracker::SeenUrlTracker(size_t capacity) : capacity_(capacity) {}

void SeenUrlTracker::MarkSeen(const ContentRef& ref) {
    if (members_.count(ref)) return;
    if (capacity_ == 0) return;

    if (order_.size() >= capacity_) {
        EvictOldest();
    }
    members_.insert(ref);
    order_.push_back(ref);
}

bool SeenUrlTracker::IsSeen(const ContentRef& ref) const {
    return members_.count(ref) > 0;
}

void SeenUrlTracker::PruneIfNeeded() {
    while (order_.size() > capacity_) {
        EvictOldest();
    }
}

void SeenUrlTracker::EvictOldest() {
    if (order_.empty()) return;
    members_.erase(order_.front());
    order_.pop_front();
}

}
