#include <catch2/catch_all.hpp>
#include <atomic>
#include <csignal>
#include <fstream>
#include <pthread.h>
#include <sstream>
#include <thread>
#include "TestSupport.hpp"
#include "media/YtDlpDownloader.hpp"
#include "parser/VideoLinkParser.hpp"
#include "parser/YtDlpMetadataParser.hpp"
#include "utils/CookieJar.hpp"
#include "utils/Subprocess.hpp"

using namespace ClipRelay;
using namespace ClipRelay::Testing;

namespace fs = std::filesystem;

namespace {

// Stand-in for the yt-dlp binary: prints `dump_json` for --dump-json,
// otherwise writes a small file to the -o target.
fs::path WriteFakeYtDlp(const fs::path& dir, const std::string& dump_json) {
    fs::path script = dir / "fake-yt-dlp.sh";
    std::ofstream o(script);
    o << "#!/bin/sh\n"
         "if [ \"$1\" = \"--dump-json\" ]; then\n"
         "  echo '" << dump_json << "'\n"
         "  exit 0\n"
         "fi\n"
         "while [ $# -gt 0 ]; do\n"
         "  if [ \"$1\" = \"-o\" ]; then shift; printf 'video' > \"$1\"; fi\n"
         "  shift\n"
         "done\n";
    o.close();
    fs::permissions(script, fs::perms::owner_all);
    return script;
}

YtDlpOptions FakeOptions(const fs::path& binary, const fs::path& out) {
    YtDlpOptions options;
    options.binary = binary.string();
    options.output_dir = out;
    options.download_timeout = std::chrono::seconds(10);
    options.metadata_timeout = std::chrono::seconds(10);
    return options;
}

}

TEST_CASE("yt-dlp JSON yields duration, trimmed caption and hashtags") {
    const std::string json =
        R"({"id":"1","duration":14.2,"description":"  Sunset run #travel #fyp #travel  ","tags":["#beach","plain","#fyp"]})"
        "\n{\"id\":\"ignored\"}";
    auto meta = YtDlpMetadataParser::Parse(json);
    REQUIRE(meta);
    REQUIRE(meta->duration);
    CHECK(*meta->duration == Catch::Approx(14.2));
    CHECK(meta->caption == "Sunset run #travel #fyp #travel");
    CHECK(meta->hashtags == std::vector<std::string>{"#travel", "#fyp", "#beach"});
}

TEST_CASE("yt-dlp JSON without optional fields still parses") {
    auto meta = YtDlpMetadataParser::Parse(R"({"id":"2"})");
    REQUIRE(meta);
    CHECK(*meta->duration == 0.0);
    CHECK(meta->caption.empty());
    CHECK(meta->hashtags.empty());

    CHECK_FALSE(YtDlpMetadataParser::Parse("ERROR: unsupported URL").has_value());
    CHECK_FALSE(YtDlpMetadataParser::Parse("[1,2]").has_value());
}

TEST_CASE("Video links are read from anchors in document order") {
    const std::string html = R"(
        <html><body>
          <a href="https://www.tiktok.com/@a/video/111?is_from_webapp=1">one</a>
          <div><a href="/@b/video/222">two</a></div>
          <a href="https://www.tiktok.com/@a/photo/333">photo</a>
          <a href="https://www.tiktok.com/@a/video/111?is_from_webapp=1">dup</a>
          <a>no href</a>
          <a href="/explore">explore</a>
        </body></html>)";

    auto links = VideoLinkParser::Parse(html);
    CHECK(links == std::vector<std::string>{
        "https://www.tiktok.com/@a/video/111?is_from_webapp=1",
        "/@b/video/222"});
    CHECK(VideoLinkParser::Parse("").empty());
}

TEST_CASE("Browser cookies convert to the Netscape format") {
    auto data = nlohmann::json::parse(R"([
        {"name":"sessionid","value":"abc","domain":".tiktok.com","path":"/","secure":true,"expirationDate":1893456000.5},
        {"name":"tt_csrf","value":"xyz"},
        {"value":"orphan"}
    ])");
    auto cookies = CookieJar::Parse(data);
    REQUIRE(cookies.size() == 2);
    CHECK(cookies[0].expiry == 1893456000LL);
    CHECK_FALSE(cookies[1].domain.has_value());

    CHECK(CookieJar::ToNetscape(cookies, ".tiktok.com") ==
          "# Netscape HTTP Cookie File\n"
          ".tiktok.com\tTRUE\t/\tTRUE\t1893456000\tsessionid\tabc\n"
          ".tiktok.com\tTRUE\t/\tFALSE\t2147483647\ttt_csrf\txyz\n");

    auto wd = CookieJar::ToWebDriver(cookies[1]);
    CHECK(wd["name"] == "tt_csrf");
    CHECK_FALSE(wd.contains("domain"));
    CHECK_FALSE(wd.contains("expiry"));
}

TEST_CASE("Cookie conversion reports unreadable input") {
    TempDir dir;
    CHECK_THROWS_AS(CookieJar::ConvertToNetscape((dir / "missing.json").string(), (dir / "out.txt").string(), ".x"), std::runtime_error);

    std::ofstream(dir / "bad.json") << "{not json";
    CHECK_THROWS_AS(CookieJar::Load((dir / "bad.json").string()), std::runtime_error);

    std::ofstream(dir / "good.json") << R"([{"name":"a","value":"1"}])";
    CookieJar::ConvertToNetscape((dir / "good.json").string(), (dir / "good.txt").string(), ".x.com");
    std::ifstream in(dir / "good.txt");
    std::stringstream ss;
    ss << in.rdbuf();
    CHECK(ss.str().find(".x.com\tTRUE\t/\tFALSE\t2147483647\ta\t1\n") != std::string::npos);
}

TEST_CASE("RunProcess captures output and enforces its deadline") {
    auto ok = RunProcess({"sh", "-c", "echo hello"}, std::chrono::seconds(5));
    CHECK(ok.Ok());
    CHECK(ok.output == "hello\n");

    auto failed = RunProcess({"sh", "-c", "exit 3"}, std::chrono::seconds(5));
    CHECK_FALSE(failed.Ok());
    CHECK(failed.exit_code == 3);

    auto slow = RunProcess({"sleep", "5"}, std::chrono::milliseconds(100));
    CHECK(slow.timed_out);
    CHECK_FALSE(slow.Ok());

    auto missing = RunProcess({"/nonexistent/binary"}, std::chrono::seconds(5));
    CHECK(missing.exit_code == 127);
}

TEST_CASE("Concurrent short runs are not held open by long-running siblings") {
    std::atomic<bool> done{false};
    std::vector<std::thread> long_runs;
    for (int i = 0; i < 6; ++i) {
        long_runs.emplace_back([&done]() {
            while (!done) RunProcess({"sleep", "1"}, std::chrono::seconds(10));
        });
    }

    std::atomic<int> timed_out{0};
    std::atomic<int> runs{0};
    std::vector<std::thread> short_runs;
    for (int i = 0; i < 4; ++i) {
        short_runs.emplace_back([&timed_out, &runs]() {
            for (int n = 0; n < 150; ++n) {
                auto res = RunProcess({"echo", "hi"}, std::chrono::milliseconds(800));
                if (res.timed_out) ++timed_out;
                ++runs;
            }
        });
    }
    for (auto& t : short_runs) t.join();
    done = true;
    for (auto& t : long_runs) t.join();

    CHECK(runs.load() == 600);
    CHECK(timed_out.load() == 0);
}

TEST_CASE("Children start with no blocked signals") {
    sigset_t block, previous;
    sigemptyset(&block);
    sigaddset(&block, SIGTERM);
    sigaddset(&block, SIGINT);
    REQUIRE(pthread_sigmask(SIG_BLOCK, &block, &previous) == 0);

    auto res = RunProcess({"grep", "SigBlk", "/proc/self/status"}, std::chrono::seconds(5));
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);

    REQUIRE(res.Ok());
    CHECK(res.output == "SigBlk:\t0000000000000000\n");
}

TEST_CASE("The downloader writes <id>.mp4 and returns its metadata") {
    TempDir dir;
    auto script = WriteFakeYtDlp(dir.Path(), R"({"duration":12.0,"description":"hi #a"})");
    YtDlpDownloader downloader(FakeOptions(script, dir / "out"));

    const std::string ref = "https://www.tiktok.com/@x/video/98765?lang=en";
    CHECK(downloader.TargetPath(ref) == dir / "out" / "98765.mp4");

    DownloadResult res = downloader.Download(ref);
    REQUIRE(res.Ok());
    CHECK(res.artifact->path == dir / "out" / "98765.mp4");
    CHECK(res.artifact->source == ref);
    CHECK(fs::exists(res.artifact->path));
    REQUIRE(res.metadata);
    CHECK(res.metadata->hashtags == std::vector<std::string>{"#a"});
}

TEST_CASE("The downloader rejects videos outside the duration window") {
    TempDir dir;
    auto script = WriteFakeYtDlp(dir.Path(), R"({"duration":120.0})");
    YtDlpDownloader downloader(FakeOptions(script, dir / "out"));

    DownloadResult res = downloader.Download("https://www.tiktok.com/@x/video/1");
    CHECK_FALSE(res.Ok());
    CHECK(res.kind == ErrorKind::Rejected);
    CHECK_FALSE(fs::exists(dir / "out" / "1.mp4"));

    VideoMetadata unknown;
    CHECK(downloader.DurationAccepted(unknown));
    unknown.duration = 3.0;
    CHECK_FALSE(downloader.DurationAccepted(unknown));
}

TEST_CASE("A failing downloader binary is a transient failure") {
    TempDir dir;
    YtDlpDownloader downloader(FakeOptions(dir / "no-such-yt-dlp", dir / "out"));
    DownloadResult res = downloader.Download("https://www.tiktok.com/@x/video/2");
    CHECK_FALSE(res.Ok());
    CHECK(res.kind == ErrorKind::Transient);
}
