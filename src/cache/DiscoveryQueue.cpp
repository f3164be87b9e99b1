#include "DiscoveryQueue.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace ClipRelay {

DiscoveryQueue::DiscoveryQueue(size_t capacity) : capacity_(capacity) {}

void DiscoveryQueue::Push(ContentRef ref) {
    if (!HasRoom()) {
        throw std::logic_error("DiscoveryQueue is full (capacity " + std::to_string(capacity_) + ")");
    }
    items_.push_back(std::move(ref));
}

ContentRef DiscoveryQueue::Pop() {
    if (items_.empty()) throw QueueEmpty("DiscoveryQueue");
    ContentRef front = std::move(items_.front());
    items_.pop_front();
    return front;
}

bool DiscoveryQueue::Contains(const ContentRef& ref) const {
    return std::find(items_.begin(), items_.end(), ref) != items_.end();
}

}
