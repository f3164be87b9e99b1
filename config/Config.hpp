#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace ClipRelay {
    struct Config {
        // Chat
        std::string bot_token = "YOUR_BOT_TOKEN_HERE";
        std::uint64_t channel_id = 0;
        std::string log_level = "info";
        int max_concurrency = 0; // 0: half of the system cores
        int chat_timeout_ms = 15000;
        int present_retries = 3;

        // Browser / discovery
        std::string webdriver_url = "http://127.0.0.1:4444";
        long webdriver_timeout_ms = 30000;
        bool browser_headless = true;
        std::string homepage_url = "https://www.tiktok.com/";
        std::string cookies_file = "cookies.json";
        std::string netscape_cookies_file = "cookies.txt";
        int discovery_retries = 5;
        int scroll_min_px = 400;
        int scroll_max_px = 1200;
        int scroll_pause_min_ms = 1000;
        int scroll_pause_max_ms = 1600;

        // Downloads
        std::string output_dir = "downloads";
        std::string ytdlp_path = "yt-dlp";
        double min_duration_seconds = 5.0;
        double max_duration_seconds = 50.0;
        int download_timeout_seconds = 180;
        int metadata_timeout_seconds = 12;
        int serve_metadata_timeout_seconds = 8;

        // Bounded containers
        int queue_capacity = 3;
        int cache_capacity = 3;
        int history_capacity = 3;
        int seen_capacity = 250;

        // Budgets and cadence
        long disk_quota_mb = 1024;
        long disk_reserve_mb = 2048;
        int maintenance_interval_seconds = 180;
        int refill_interval_ms = 1000;
        int refill_backoff_ms = 5000;
        int restart_preload_threshold = 200;
        long memory_soft_limit_mb = 1200;
        int post_flow_timeout_minutes = 30;

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
        nlohmann::json ToJson() const;
    };
}
