#include "ReadyCache.hpp"
#include "../core/Errors.hpp"
#include "../utils/Logger.hpp"

namespace ClipRelay {

ReadyCache::ReadyCache(size_t capacity, ArtifactStore& store)
    : capacity_(capacity == 0 ? 1 : capacity), store_(store) {}

void ReadyCache::Push(Artifact artifact) {
    while (items_.size() >= capacity_) {
        Artifact oldest = std::move(items_.front());
        items_.pop_front();
        if (oldest.path != artifact.path) {
            Logger::Log(LogLevel::Debug, "Ready cache full, ageing out " + oldest.path.string());
            store_.Discard(oldest.path);
        }
    }
    items_.push_back(std::move(artifact));
}

Artifact ReadyCache::Pop() {
    if (items_.empty()) throw QueueEmpty("ReadyCache");
    Artifact front = std::move(items_.front());
    items_.pop_front();
    return front;
}

std::vector<std::filesystem::path> ReadyCache::Paths() const {
    std::vector<std::filesystem::path> paths;
    paths.reserve(items_.size());
    for (const auto& a : items_) paths.push_back(a.path);
    return paths;
}

}
