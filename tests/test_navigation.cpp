#include <catch2/catch_all.hpp>
#include <thread>
#include "PipelineRig.hpp"
#include "core/NavigationHandler.hpp"
#include "core/PostFlow.hpp"
#include "utils/CaptionBuilder.hpp"

using namespace ClipRelay;
using namespace ClipRelay::Testing;

namespace fs = std::filesystem;

namespace {

constexpr RequesterId kChat = 42;

struct ChatRig {
    ChatRig() : pipeline(Urls(6)), pool(1), handler(pipeline.orchestrator, channel, flows, publisher, pool, FastOptions()) {
        pipeline.orchestrator.Startup();
    }

    static NavigationHandler::Options FastOptions() {
        NavigationHandler::Options options;
        options.present_retries = 3;
        options.retry_pause = std::chrono::milliseconds(0);
        return options;
    }

    Rig pipeline;
    FakeChannel channel;
    PostFlowRegistry flows;
    FakePublisher publisher;
    ThreadPool pool;
    NavigationHandler handler;
};

bool WaitFor(const std::function<bool()>& condition) {
    for (int i = 0; i < 200; ++i) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

}

TEST_CASE("The first presentation carries the intro, caption and hashtags") {
    ChatRig rig;
    REQUIRE(rig.handler.PresentCurrent(kChat, "Welcome!"));

    REQUIRE(rig.channel.presented.size() == 1);
    const Presentation& p = rig.channel.presented[0];
    CHECK(p.target == kChat);
    CHECK(p.file == rig.pipeline.FileFor(1));
    CHECK(p.nav_index == 0);
    CHECK(p.caption == "Welcome!\n\nOriginal Caption: caption for 1\n\nHashtags: #fyp");
    CHECK_FALSE(p.actions.previous);
    CHECK(p.actions.post);
    CHECK(p.actions.next);
}

TEST_CASE("Next presents the following video with a way back") {
    ChatRig rig;
    rig.handler.OnSignal(kChat, Signal::Next);

    REQUIRE(rig.channel.presented.size() == 1);
    CHECK(rig.channel.presented[0].file == rig.pipeline.FileFor(2));
    CHECK(rig.channel.presented[0].nav_index == 1);
    CHECK(rig.channel.presented[0].actions.previous);

    rig.handler.OnSignal(kChat, Signal::Previous);
    REQUIRE(rig.channel.presented.size() == 2);
    CHECK(rig.channel.presented[1].file == rig.pipeline.FileFor(1));
    CHECK_FALSE(rig.channel.presented[1].actions.previous);
}

TEST_CASE("Previous at the oldest video answers with a notice") {
    ChatRig rig;
    rig.handler.OnSignal(kChat, Signal::Previous);

    CHECK(rig.channel.presented.empty());
    REQUIRE(rig.channel.texts.size() == 1);
    CHECK(rig.channel.texts[0] == "Already at the first video");
}

TEST_CASE("Next with nothing left answers with a notice") {
    ChatRig rig;
    {
        std::lock_guard<std::mutex> lock(rig.pipeline.state.mutex);
        while (!rig.pipeline.state.queue.Empty()) rig.pipeline.state.queue.Pop();
    }
    rig.handler.OnSignal(kChat, Signal::Next);   // consumes the ready video
    rig.handler.OnSignal(kChat, Signal::Next);

    REQUIRE(rig.channel.texts.size() == 1);
    CHECK(rig.channel.texts[0] == "Nothing available right now");
}

TEST_CASE("Presentation is retried a bounded number of times") {
    ChatRig rig;

    SECTION("succeeds on the last attempt") {
        rig.channel.failures_left = 2;
        CHECK(rig.handler.PresentCurrent(kChat));
        CHECK(rig.channel.presented.size() == 3);
    }

    SECTION("gives up after every attempt fails") {
        rig.channel.failures_left = 5;
        CHECK_FALSE(rig.handler.PresentCurrent(kChat));
        CHECK(rig.channel.presented.size() == 3);
    }
}

TEST_CASE("A missing file is not presented") {
    ChatRig rig;
    fs::remove(rig.pipeline.FileFor(1));
    CHECK_FALSE(rig.handler.PresentCurrent(kChat));
    CHECK(rig.channel.presented.empty());
}

TEST_CASE("Posting asks for a comment, then hashtags, then publishes") {
    ChatRig rig;
    rig.handler.OnSignal(kChat, Signal::Post);
    REQUIRE(rig.channel.texts.size() == 1);
    CHECK(rig.channel.texts[0] == "What would you like to comment?");
    CHECK(rig.flows.Has(kChat));

    rig.handler.OnText(kChat, "so good");
    REQUIRE(rig.channel.texts.size() == 2);
    CHECK(rig.channel.texts[1] == "What would you like as your #?");
    CHECK(rig.channel.deleted == std::vector<MessageId>{100});

    rig.handler.OnText(kChat, "#cats  #funny");
    REQUIRE(rig.channel.texts.size() == 3);
    CHECK(rig.channel.next_flags[2]);
    CHECK(rig.channel.deleted == std::vector<MessageId>{100, 101});
    CHECK_FALSE(rig.flows.Has(kChat));

    REQUIRE(WaitFor([&rig]() { return rig.publisher.published.load() == 1; }));
    std::lock_guard<std::mutex> lock(rig.publisher.mutex);
    CHECK(rig.publisher.last_file == rig.pipeline.FileFor(1));
    CHECK(rig.publisher.last_comment == "so good");
    CHECK(rig.publisher.last_hashtags == std::vector<std::string>{"#cats", "#funny"});
}

TEST_CASE("Text outside a post flow is ignored") {
    ChatRig rig;
    rig.handler.OnText(kChat, "hello");
    CHECK(rig.channel.texts.empty());
    CHECK(rig.channel.deleted.empty());
}

TEST_CASE("Stale post flows expire") {
    PostFlowRegistry flows;
    auto now = PostFlowRegistry::Clock::now();
    flows.Begin(1, "a.mp4", now - std::chrono::minutes(31));
    flows.Begin(2, "b.mp4", now - std::chrono::minutes(5));

    CHECK(flows.ExpireOlderThan(std::chrono::minutes(30), now) == 1);
    CHECK_FALSE(flows.Has(1));
    CHECK(flows.Has(2));
}

TEST_CASE("Starting a new post replaces the pending one") {
    PostFlowRegistry flows;
    flows.Begin(7, "a.mp4");
    flows.AddPrompt(7, 1);
    CHECK(flows.OnText(7, "first").kind == PostTransition::Kind::AskHashtags);

    flows.Begin(7, "b.mp4");
    PostTransition t = flows.OnText(7, "second");
    CHECK(t.kind == PostTransition::Kind::AskHashtags);
    CHECK(t.flow.artifact == fs::path("b.mp4"));
    CHECK(t.flow.comment == "second");
    CHECK(flows.Size() == 1);
}

TEST_CASE("Hashtag replies split on whitespace") {
    CHECK(PostFlowRegistry::SplitHashtags("  #a\t#b\n#c ") == std::vector<std::string>{"#a", "#b", "#c"});
    CHECK(PostFlowRegistry::SplitHashtags("   ").empty());
}

TEST_CASE("Button ids map to signals") {
    CHECK(ParseSignal("next_video") == Signal::Next);
    CHECK(ParseSignal("prev_video") == Signal::Previous);
    CHECK(ParseSignal("post_video") == Signal::Post);
    CHECK(ParseSignal("post_next") == Signal::PostNext);
    CHECK_FALSE(ParseSignal("bogus").has_value());
    CHECK(std::string(SignalId(Signal::PostNext)) == "post_next");
}

TEST_CASE("Captions skip the parts that are missing") {
    CHECK(BuildCaption("", std::nullopt).empty());
    CHECK(BuildCaption("Hi", std::nullopt) == "Hi");

    VideoMetadata meta;
    meta.hashtags = {"#a", "#b"};
    CHECK(BuildCaption("", meta) == "Hashtags: #a #b");

    CHECK_FALSE(ActionsFor(0).previous);
    CHECK(ActionsFor(2).previous);
}

TEST_CASE("Long captions are clipped on a character boundary") {
    CHECK(ClipText("short", 2000) == "short");
    CHECK(ClipText("abcdefghij", 8) == "abcde...");

    // "\xF0\x9F\x8E\xAC" is a four-byte emoji straddling the cut.
    std::string text = std::string(1995, 'a') + "\xF0\x9F\x8E\xAC" + "tail";
    std::string clipped = ClipText(text, 2000);
    CHECK(clipped == std::string(1995, 'a') + "...");
    CHECK(clipped.size() <= 2000);

    std::string fits = std::string(1990, 'a') + "\xF0\x9F\x8E\xAC" + std::string(20, 'b');
    CHECK(ClipText(fits, 2000) == std::string(1990, 'a') + "\xF0\x9F\x8E\xAC" + "bbb...");
}
