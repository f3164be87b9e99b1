#pragma once
#include <functional>
#include <optional>
#include <vector>
#include "ArtifactStore.hpp"

namespace ClipRelay {
    // Previously served artifacts with a cursor on the one being displayed.
    // Only PushPlayed, MovePrevious and ReclaimOne move the cursor.
    // Invariant: cursor is a valid index, or -1 iff the log is empty.
    class HistoryLog {
    public:
        using ChangeHook = std::function<void()>;

        HistoryLog(size_t capacity, ArtifactStore& store);

        void PushPlayed(Artifact artifact, bool advance_cursor);

        // Steps back one entry. Returns false at the oldest entry (or when empty).
        bool MovePrevious();

        // Frees one entry for the disk janitor, never the current one while an
        // alternative exists. Returns the deleted path, or nullopt when only the
        // current artifact remains.
        std::optional<std::filesystem::path> ReclaimOne();

        std::optional<Artifact> Current() const;
        int CurrentIndex() const { return cursor_; }
        bool Empty() const { return items_.empty(); }
        size_t Size() const { return items_.size(); }
        size_t Capacity() const { return capacity_; }
        const Artifact& At(size_t index) const { return items_.at(index); }
        std::vector<std::filesystem::path> Paths() const;

        // Runs after every PushPlayed (opportunistic cleanup).
        void SetChangeHook(ChangeHook hook) { on_change_ = std::move(hook); }

    private:
        size_t capacity_;
        ArtifactStore& store_;
        std::vector<Artifact> items_;
        int cursor_ = -1;
        ChangeHook on_change_;
    };
}
