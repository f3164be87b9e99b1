#include "VideoLinkScraper.hpp"
#include "../parser/VideoLinkParser.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>
#include <thread>

namespace ClipRelay {

VideoLinkScraper::VideoLinkScraper(BrowserSession& session, ScrapeOptions options)
    : session_(session), options_(options), rng_(std::random_device{}()) {}

DiscoveryResult VideoLinkScraper::DiscoverOne(const SeenPredicate& is_seen) {
    auto session_lock = session_.Acquire();
    const std::string& homepage = session_.Options().homepage_url;

    for (int attempt = 0; attempt < options_.retries; ++attempt) {
        try {
            std::uniform_int_distribution<int> scroll(options_.scroll_min_px, std::max(options_.scroll_min_px, options_.scroll_max_px));
            session_.ExecuteScript("window.scrollBy(0, arguments[0]);", nlohmann::json::array({scroll(rng_)}));
            session_.PauseRandom(options_.pause_min_ms, options_.pause_max_ms);

            auto links = VideoLinkParser::Parse(session_.PageSource());
            std::shuffle(links.begin(), links.end(), rng_);
            for (const auto& href : links) {
                std::string url = UrlUtil::ResolveAgainst(homepage, href);
                if (!is_seen(url)) {
                    Logger::Log(LogLevel::Info, "Found video link: " + url);
                    return {url, ErrorKind::None, ""};
                }
            }
            Logger::Log(LogLevel::Debug, "Attempt " + std::to_string(attempt + 1) + ": " + std::to_string(links.size()) + " links, none unseen");
        } catch (const PipelineError& e) {
            Logger::Log(LogLevel::Warn, "Attempt " + std::to_string(attempt + 1) + " failed to find video link: " + e.what());
            if (e.Kind() == ErrorKind::Fatal) {
                return {std::nullopt, ErrorKind::Fatal, e.what()};
            }
        }

        if (attempt % 2 == 0) {
            try {
                session_.Refresh();
            } catch (const PipelineError& e) {
                Logger::Log(LogLevel::Warn, "Feed refresh failed: " + std::string(e.what()));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(options_.refresh_pause_ms));
        }
    }
    return {std::nullopt, ErrorKind::Fatal, "Failed to locate unique video link after " + std::to_string(options_.retries) + " attempts"};
}

}
