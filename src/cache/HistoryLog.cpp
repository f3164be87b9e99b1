#include "HistoryLog.hpp"
#include "../utils/Logger.hpp"

namespace ClipRelay {

HistoryLog::HistoryLog(size_t capacity, ArtifactStore& store)
    : capacity_(capacity == 0 ? 1 : capacity), store_(store) {}

void HistoryLog::PushPlayed(Artifact artifact, bool advance_cursor) {
    const std::filesystem::path appended = artifact.path;
    items_.push_back(std::move(artifact));

    if (items_.size() > capacity_) {
        Artifact evicted = std::move(items_.front());
        items_.erase(items_.begin());
        if (evicted.path != appended) {
            store_.Discard(evicted.path);
        }
        if (cursor_ > 0) --cursor_;
    }

    if (advance_cursor || cursor_ < 0) {
        cursor_ = static_cast<int>(items_.size()) - 1;
    }

    if (on_change_) on_change_();
}

bool HistoryLog::MovePrevious() {
    if (cursor_ <= 0) return false;
    --cursor_;
    return true;
}

std::optional<std::filesystem::path> HistoryLog::ReclaimOne() {
    if (items_.empty()) return std::nullopt;

    if (cursor_ == 0) {
        // The oldest entry is on screen; take the second-oldest instead.
        if (items_.size() < 2) return std::nullopt;
        Artifact second = std::move(items_[1]);
        items_.erase(items_.begin() + 1);
        if (second.path != items_.front().path) {
            store_.Discard(second.path);
        }
        return second.path;
    }

    Artifact oldest = std::move(items_.front());
    items_.erase(items_.begin());
    if (cursor_ > 0) --cursor_;
    auto current = Current();
    if (!current || current->path != oldest.path) {
        store_.Discard(oldest.path);
    }
    return oldest.path;
}

std::optional<Artifact> HistoryLog::Current() const {
    if (cursor_ < 0 || cursor_ >= static_cast<int>(items_.size())) return std::nullopt;
    return items_[static_cast<size_t>(cursor_)];
}

std::vector<std::filesystem::path> HistoryLog::Paths() const {
    std::vector<std::filesystem::path> paths;
    paths.reserve(items_.size());
    for (const auto& a : items_) paths.push_back(a.path);
    return paths;
}

}
