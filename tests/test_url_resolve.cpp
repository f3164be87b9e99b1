#include <catch2/catch_all.hpp>
#include "utils/UrlUtil.hpp"

using namespace ClipRelay;

TEST_CASE("ResolveAgainst turns scraped hrefs into absolute video URLs") {
    using UrlUtil::ResolveAgainst;

    std::string feed = "https://www.tiktok.com/foryou?lang=en";
    CHECK(ResolveAgainst(feed, "https://www.tiktok.com/@a/video/1") == "https://www.tiktok.com/@a/video/1");
    CHECK(ResolveAgainst(feed, "//www.tiktok.com/@a/video/2") == "https://www.tiktok.com/@a/video/2");
    CHECK(ResolveAgainst(feed, "/@a/video/3") == "https://www.tiktok.com/@a/video/3");
    CHECK(ResolveAgainst("https://www.tiktok.com/@a/", "video/4") == "https://www.tiktok.com/@a/video/4");
    CHECK(ResolveAgainst("not a url", "/@a/video/5") == "/@a/video/5");
}

TEST_CASE("Video links are recognised by their path") {
    CHECK(UrlUtil::IsVideoLink("https://www.tiktok.com/@a/video/123"));
    CHECK(UrlUtil::IsVideoLink("/@a/video/123?is_from_webapp=1"));
    CHECK_FALSE(UrlUtil::IsVideoLink("https://www.tiktok.com/@a/photo/123"));
    CHECK_FALSE(UrlUtil::IsVideoLink("https://www.tiktok.com/search?q=/video/"));
}

TEST_CASE("Video ids come from the last path segment") {
    CHECK(UrlUtil::VideoIdFromUrl("https://www.tiktok.com/@a/video/7312?lang=en") == "7312");
    CHECK(UrlUtil::VideoIdFromUrl("https://www.tiktok.com/@a/video/7312/") == "7312");
    CHECK(UrlUtil::VideoIdFromUrl("https://www.tiktok.com/@a/video/7312#top") == "7312");
}

TEST_CASE("Video page URLs are rebuilt from the homepage host") {
    CHECK(UrlUtil::VideoPageUrl("https://www.tiktok.com/", "55") == "https://www.tiktok.com/video/55");
    CHECK(UrlUtil::VideoPageUrl("https://www.tiktok.com/foryou", "55") == "https://www.tiktok.com/video/55");
    CHECK(UrlUtil::HostOf("https://WWW.TikTok.com:443/foryou") == "www.tiktok.com");
    CHECK(UrlUtil::HostOf("www.tiktok.com").empty());
}
