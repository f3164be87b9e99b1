#pragma once
#include <random>
#include <string>
#include "BrowserSession.hpp"
#include "../interfaces/IContentDiscoverer.hpp"

namespace ClipRelay {

struct ScrapeOptions {
    int retries = 5;
    int scroll_min_px = 400;
    int scroll_max_px = 1200;
    int pause_min_ms = 1000;
    int pause_max_ms = 1600;
    int refresh_pause_ms = 1200;
};

// Finds fresh video links by scrolling the logged-in feed and reading anchors
// out of the page source.
class VideoLinkScraper : public IContentDiscoverer {
public:
    VideoLinkScraper(BrowserSession& session, ScrapeOptions options);

    DiscoveryResult DiscoverOne(const SeenPredicate& is_seen) override;

private:
    BrowserSession& session_;
    ScrapeOptions options_;
    std::mt19937 rng_;
};

}
