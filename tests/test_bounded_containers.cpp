#include <catch2/catch_all.hpp>
#include <deque>
#include <random>
#include <set>
#include "TestSupport.hpp"
#include "cache/ArtifactStore.hpp"
#include "cache/DiscoveryQueue.hpp"
#include "cache/HistoryLog.hpp"
#include "cache/ReadyCache.hpp"
#include "cache/SeenUrlTracker.hpp"
#include "core/PipelineState.hpp"

using namespace ClipRelay;
using namespace ClipRelay::Testing;

namespace fs = std::filesystem;

namespace {

Artifact NewArtifact(ArtifactStore& store, const fs::path& dir, int n) {
    fs::path p = MakeFile(dir / (std::to_string(n) + ".mp4"));
    VideoMetadata meta;
    meta.caption = "clip " + std::to_string(n);
    store.Remember(p, meta);
    return Artifact{p, "ref-" + std::to_string(n)};
}

// Every path in `live` is on disk with metadata; every path in `gone` is deleted and purged.
void CheckFiles(const ArtifactStore& store, const std::set<fs::path>& live, const std::set<fs::path>& gone) {
    for (const auto& p : live) {
        CHECK(fs::exists(p));
        CHECK(store.HasMetadata(p));
    }
    for (const auto& p : gone) {
        CHECK_FALSE(fs::exists(p));
        CHECK_FALSE(store.HasMetadata(p));
    }
}

}

TEST_CASE("SeenUrlTracker keeps only the most recent identifiers") {
    SeenUrlTracker seen(3);
    for (int i = 1; i <= 5; ++i) seen.MarkSeen("u" + std::to_string(i));

    CHECK(seen.Size() == 3);
    CHECK_FALSE(seen.IsSeen("u1"));
    CHECK_FALSE(seen.IsSeen("u2"));
    CHECK(seen.IsSeen("u3"));
    CHECK(seen.IsSeen("u4"));
    CHECK(seen.IsSeen("u5"));
}

TEST_CASE("SeenUrlTracker lookups do not refresh recency") {
    SeenUrlTracker seen(2);
    seen.MarkSeen("a");
    seen.MarkSeen("b");
    CHECK(seen.IsSeen("a"));
    seen.MarkSeen("a"); // already present, no reordering
    seen.MarkSeen("c");
    CHECK_FALSE(seen.IsSeen("a"));
    CHECK(seen.IsSeen("b"));
    CHECK(seen.IsSeen("c"));
}

TEST_CASE("SeenUrlTracker with zero capacity remembers nothing") {
    SeenUrlTracker seen(0);
    seen.MarkSeen("a");
    CHECK(seen.Size() == 0);
    CHECK_FALSE(seen.IsSeen("a"));
    seen.PruneIfNeeded();
    CHECK(seen.Size() == 0);
}

TEST_CASE("DiscoveryQueue is FIFO and refuses to overflow") {
    DiscoveryQueue q(2);
    q.Push("a");
    q.Push("b");
    CHECK_FALSE(q.HasRoom());
    CHECK(q.Contains("b"));
    CHECK_THROWS_AS(q.Push("c"), std::logic_error);
    CHECK(q.Size() == 2);

    CHECK(q.Pop() == "a");
    CHECK(q.Pop() == "b");
    CHECK(q.Empty());
}

TEST_CASE("Popping an empty container reports NotFound") {
    TempDir dir;
    ArtifactStore store(dir.Path());
    DiscoveryQueue q(1);
    ReadyCache ready(1, store);

    CHECK_THROWS_AS(q.Pop(), QueueEmpty);
    try {
        ready.Pop();
        FAIL("expected QueueEmpty");
    } catch (const PipelineError& e) {
        CHECK(e.Kind() == ErrorKind::NotFound);
        CHECK(std::string(e.what()) == "ReadyCache is empty");
    }
}

TEST_CASE("ReadyCache ages out the oldest file at capacity") {
    TempDir dir;
    ArtifactStore store(dir.Path());
    ReadyCache ready(1, store);

    auto a = MakeFile(dir / "a.mp4");
    auto b = MakeFile(dir / "b.mp4");
    store.Remember(a, VideoMetadata{});

    ready.Push(Artifact{a, "https://x/video/a"});
    ready.Push(Artifact{b, "https://x/video/b"});

    CHECK(ready.Size() == 1);
    CHECK_FALSE(fs::exists(a));
    CHECK_FALSE(store.HasMetadata(a));
    CHECK(fs::exists(b));
    CHECK(ready.Pop().path == b);
}

TEST_CASE("ReadyCache re-push of the same path keeps the file") {
    TempDir dir;
    ArtifactStore store(dir.Path());
    ReadyCache ready(1, store);
    auto a = MakeFile(dir / "a.mp4");

    ready.Push(Artifact{a, ""});
    ready.Push(Artifact{a, ""});
    CHECK(ready.Size() == 1);
    CHECK(fs::exists(a));
}

TEST_CASE("HistoryLog keeps the newest entries and follows the cursor") {
    TempDir dir;
    ArtifactStore store(dir.Path());
    HistoryLog history(3, store);

    std::vector<fs::path> files;
    for (int i = 1; i <= 4; ++i) {
        files.push_back(MakeFile(dir / ("v" + std::to_string(i) + ".mp4")));
        history.PushPlayed(Artifact{files.back(), ""}, true);
    }

    CHECK(history.Size() == 3);
    CHECK(history.CurrentIndex() == 2);
    CHECK(history.Current()->path == files[3]);
    CHECK_FALSE(fs::exists(files[0]));
    CHECK(fs::exists(files[1]));
}

TEST_CASE("HistoryLog cursor tracks its entry when the front is evicted") {
    TempDir dir;
    ArtifactStore store(dir.Path());
    HistoryLog history(3, store);

    for (int i = 1; i <= 3; ++i) {
        history.PushPlayed(Artifact{MakeFile(dir / ("v" + std::to_string(i) + ".mp4")), ""}, true);
    }
    REQUIRE(history.MovePrevious());
    auto viewing = history.Current()->path; // v2
    history.PushPlayed(Artifact{MakeFile(dir / "v4.mp4"), ""}, false);

    CHECK(history.CurrentIndex() == 0);
    CHECK(history.Current()->path == viewing);
}

TEST_CASE("HistoryLog MovePrevious stops at the oldest entry") {
    TempDir dir;
    ArtifactStore store(dir.Path());
    HistoryLog history(3, store);

    CHECK_FALSE(history.MovePrevious());
    CHECK(history.CurrentIndex() == -1);

    history.PushPlayed(Artifact{MakeFile(dir / "a.mp4"), ""}, true);
    history.PushPlayed(Artifact{MakeFile(dir / "b.mp4"), ""}, true);
    CHECK(history.MovePrevious());
    CHECK(history.CurrentIndex() == 0);
    CHECK_FALSE(history.MovePrevious());
    CHECK(history.CurrentIndex() == 0);
}

TEST_CASE("HistoryLog ReclaimOne spares the displayed entry") {
    TempDir dir;
    ArtifactStore store(dir.Path());
    HistoryLog history(3, store);

    auto a = MakeFile(dir / "a.mp4");
    auto b = MakeFile(dir / "b.mp4");
    auto c = MakeFile(dir / "c.mp4");
    history.PushPlayed(Artifact{a, ""}, true);
    history.PushPlayed(Artifact{b, ""}, true);
    history.PushPlayed(Artifact{c, ""}, true);

    SECTION("cursor past the front: oldest goes") {
        auto freed = history.ReclaimOne();
        REQUIRE(freed);
        CHECK(*freed == a);
        CHECK_FALSE(fs::exists(a));
        CHECK(history.Current()->path == c);
        CHECK(history.CurrentIndex() == 1);
    }

    SECTION("cursor on the oldest: second-oldest goes") {
        REQUIRE(history.MovePrevious());
        REQUIRE(history.MovePrevious());
        auto freed = history.ReclaimOne();
        REQUIRE(freed);
        CHECK(*freed == b);
        CHECK(fs::exists(a));
        CHECK_FALSE(fs::exists(b));
        CHECK(history.CurrentIndex() == 0);
        CHECK(history.Current()->path == a);
    }

    SECTION("only the current entry left") {
        REQUIRE(history.ReclaimOne());
        REQUIRE(history.ReclaimOne());
        CHECK(history.Size() == 1);
        CHECK_FALSE(history.ReclaimOne().has_value());
        CHECK(fs::exists(c));
    }
}

TEST_CASE("PipelineState sweeps unreferenced files after each played push") {
    TempDir dir;
    PipelineLimits limits;
    PipelineState state(limits, dir.Path());

    auto stray = MakeFile(dir / "stray.mp4");
    auto keep_me = MakeFile(dir / "notes.txt");
    auto ready = MakeFile(dir / "ready.mp4");
    auto played = MakeFile(dir / "played.mp4");
    auto pending = dir / "pending.mp4";

    std::lock_guard<std::mutex> lock(state.mutex);
    state.ready.Push(Artifact{ready, ""});
    state.BeginTransfer(pending);
    MakeFile(pending);
    state.history.PushPlayed(Artifact{played, ""}, true);

    CHECK_FALSE(fs::exists(stray));
    CHECK(fs::exists(keep_me));
    CHECK(fs::exists(ready));
    CHECK(fs::exists(played));
    CHECK(fs::exists(pending));

    state.EndTransfer(pending);
    CHECK(state.SweepUntracked() == 1);
    CHECK_FALSE(fs::exists(pending));
}

TEST_CASE("ArtifactStore tracks the extension case-insensitively") {
    TempDir dir;
    ArtifactStore store(dir.Path());
    MakeFile(dir / "a.MP4", 10);
    MakeFile(dir / "b.mp4", 20);
    MakeFile(dir / "c.webm", 1000);

    CHECK(store.ListTrackedFiles().size() == 2);
    CHECK(store.TrackedBytes() == 30);
}

TEST_CASE("ArtifactStore discard of a missing file is harmless") {
    TempDir dir;
    ArtifactStore store(dir.Path());
    auto ghost = dir / "ghost.mp4";
    store.Remember(ghost, VideoMetadata{});
    CHECK_NOTHROW(store.Discard(ghost));
    CHECK_FALSE(store.HasMetadata(ghost));
}

TEST_CASE("SeenUrlTracker matches an insertion-ordered window over random identifiers") {
    const auto seed = GENERATE(1u, 17u, 4242u);
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> pick(0, 599);

    SeenUrlTracker seen(250);
    std::deque<ContentRef> window;
    std::set<ContentRef> members;

    for (int step = 0; step < 3000; ++step) {
        ContentRef ref = "https://www.tiktok.com/@u/video/" + std::to_string(pick(rng));
        seen.MarkSeen(ref);
        if (!members.count(ref)) {
            if (window.size() == 250) {
                members.erase(window.front());
                window.pop_front();
            }
            window.push_back(ref);
            members.insert(ref);
        }
        REQUIRE(seen.Size() == window.size());
        REQUIRE(seen.Size() <= 250);

        if (step % 100 == 99) {
            for (int id = 0; id < 600; ++id) {
                ContentRef candidate = "https://www.tiktok.com/@u/video/" + std::to_string(id);
                REQUIRE(seen.IsSeen(candidate) == (members.count(candidate) > 0));
            }
            seen.PruneIfNeeded();
            REQUIRE(seen.Size() == window.size());
        }
    }
}

TEST_CASE("ReadyCache stays bounded and deletes each aged-out file over random sequences") {
    const auto seed = GENERATE(3u, 99u, 2024u);
    const size_t capacity = GENERATE(as<size_t>{}, 1, 3);
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> op(0, 9);

    TempDir dir;
    ArtifactStore store(dir.Path());
    ReadyCache ready(capacity, store);

    std::deque<Artifact> model;
    std::set<fs::path> live;
    std::set<fs::path> gone;
    int next_id = 0;

    for (int step = 0; step < 200; ++step) {
        const int roll = op(rng);
        if (roll < 3 && !model.empty()) {
            Artifact popped = ready.Pop();
            REQUIRE(popped == model.front());
            model.pop_front();
            // Popped files belong to the caller now.
            live.erase(popped.path);
            fs::remove(popped.path);
            store.Discard(popped.path);
        } else if (roll == 3 && model.size() == capacity) {
            // Re-pushing the entry about to be aged out keeps its file.
            Artifact again = model.front();
            ready.Push(again);
            model.pop_front();
            model.push_back(again);
        } else {
            Artifact fresh = NewArtifact(store, dir.Path(), next_id++);
            ready.Push(fresh);
            if (model.size() == capacity) {
                gone.insert(model.front().path);
                live.erase(model.front().path);
                model.pop_front();
            }
            model.push_back(fresh);
            live.insert(fresh.path);
        }

        REQUIRE(ready.Size() == model.size());
        REQUIRE(ready.Size() <= capacity);
        std::vector<fs::path> expected;
        for (const auto& a : model) expected.push_back(a.path);
        REQUIRE(ready.Paths() == expected);
        CheckFiles(store, live, gone);
    }
}

TEST_CASE("HistoryLog keeps its bound and cursor invariant over random sequences") {
    const auto seed = GENERATE(5u, 77u, 31337u);
    const size_t capacity = GENERATE(as<size_t>{}, 1, 3);
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> op(0, 9);

    TempDir dir;
    ArtifactStore store(dir.Path());
    HistoryLog history(capacity, store);

    std::vector<Artifact> model;
    int cursor = -1;
    std::set<fs::path> live;
    std::set<fs::path> gone;
    int next_id = 0;

    for (int step = 0; step < 200; ++step) {
        const int roll = op(rng);
        if (roll < 3) {
            const bool moved = history.MovePrevious();
            REQUIRE(moved == (cursor > 0));
            if (cursor > 0) --cursor;
        } else {
            const bool advance = roll >= 6;
            // Now and then replay the entry about to be evicted.
            const bool replay = roll == 3 && model.size() == capacity;
            Artifact item = replay ? model.front() : NewArtifact(store, dir.Path(), next_id++);

            history.PushPlayed(item, advance);
            model.push_back(item);
            live.insert(item.path);
            if (model.size() > capacity) {
                Artifact evicted = model.front();
                model.erase(model.begin());
                if (evicted.path != item.path) {
                    gone.insert(evicted.path);
                    live.erase(evicted.path);
                }
                if (cursor > 0) --cursor;
            }
            if (advance || cursor < 0) cursor = static_cast<int>(model.size()) - 1;
        }

        REQUIRE(history.Size() == model.size());
        REQUIRE(history.Size() <= capacity);
        REQUIRE(history.CurrentIndex() == cursor);
        if (history.Empty()) {
            REQUIRE(history.CurrentIndex() == -1);
        } else {
            REQUIRE(history.CurrentIndex() >= 0);
            REQUIRE(history.CurrentIndex() < static_cast<int>(history.Size()));
            REQUIRE(history.Current()->path == model[static_cast<size_t>(cursor)].path);
        }
        CheckFiles(store, live, gone);
    }
}
