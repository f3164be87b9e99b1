#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>

namespace ClipRelay {

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["bot_token"] = bot_token;
    data["channel_id"] = std::to_string(channel_id);
    data["log_level"] = log_level;
    data["max_concurrency"] = max_concurrency;
    data["chat_timeout_ms"] = chat_timeout_ms;
    data["present_retries"] = present_retries;

    data["webdriver_url"] = webdriver_url;
    data["webdriver_timeout_ms"] = webdriver_timeout_ms;
    data["browser_headless"] = browser_headless;
    data["homepage_url"] = homepage_url;
    data["cookies_file"] = cookies_file;
    data["netscape_cookies_file"] = netscape_cookies_file;
    data["discovery_retries"] = discovery_retries;
    data["scroll_min_px"] = scroll_min_px;
    data["scroll_max_px"] = scroll_max_px;
    data["scroll_pause_min_ms"] = scroll_pause_min_ms;
    data["scroll_pause_max_ms"] = scroll_pause_max_ms;

    data["output_dir"] = output_dir;
    data["ytdlp_path"] = ytdlp_path;
    data["min_duration_seconds"] = min_duration_seconds;
    data["max_duration_seconds"] = max_duration_seconds;
    data["download_timeout_seconds"] = download_timeout_seconds;
    data["metadata_timeout_seconds"] = metadata_timeout_seconds;
    data["serve_metadata_timeout_seconds"] = serve_metadata_timeout_seconds;

    data["queue_capacity"] = queue_capacity;
    data["cache_capacity"] = cache_capacity;
    data["history_capacity"] = history_capacity;
    data["seen_capacity"] = seen_capacity;

    data["disk_quota_mb"] = disk_quota_mb;
    data["disk_reserve_mb"] = disk_reserve_mb;
    data["maintenance_interval_seconds"] = maintenance_interval_seconds;
    data["refill_interval_ms"] = refill_interval_ms;
    data["refill_backoff_ms"] = refill_backoff_ms;
    data["restart_preload_threshold"] = restart_preload_threshold;
    data["memory_soft_limit_mb"] = memory_soft_limit_mb;
    data["post_flow_timeout_minutes"] = post_flow_timeout_minutes;
    return data;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);

    bot_token = data.value("bot_token", bot_token);
    // Snowflakes exceed the safe JSON integer range, so accept a string too.
    if (data.contains("channel_id")) {
        const auto& c = data["channel_id"];
        if (c.is_string()) {
            const std::string text = c.get<std::string>();
            try {
                size_t used = 0;
                channel_id = std::stoull(text, &used);
                if (used != text.size()) throw std::invalid_argument(text);
            } catch (const std::logic_error&) {
                throw std::runtime_error("Invalid channel_id in " + path + ": \"" + text + "\"");
            }
        }
        else if (c.is_number_unsigned() || c.is_number_integer()) channel_id = c.get<std::uint64_t>();
    }
    log_level = data.value("log_level", log_level);
    max_concurrency = data.value("max_concurrency", max_concurrency);
    chat_timeout_ms = data.value("chat_timeout_ms", chat_timeout_ms);
    present_retries = data.value("present_retries", present_retries);

    webdriver_url = data.value("webdriver_url", webdriver_url);
    webdriver_timeout_ms = data.value("webdriver_timeout_ms", webdriver_timeout_ms);
    browser_headless = data.value("browser_headless", browser_headless);
    homepage_url = data.value("homepage_url", homepage_url);
    cookies_file = data.value("cookies_file", cookies_file);
    netscape_cookies_file = data.value("netscape_cookies_file", netscape_cookies_file);
    discovery_retries = data.value("discovery_retries", discovery_retries);
    scroll_min_px = data.value("scroll_min_px", scroll_min_px);
    scroll_max_px = data.value("scroll_max_px", scroll_max_px);
    scroll_pause_min_ms = data.value("scroll_pause_min_ms", scroll_pause_min_ms);
    scroll_pause_max_ms = data.value("scroll_pause_max_ms", scroll_pause_max_ms);

    output_dir = data.value("output_dir", output_dir);
    ytdlp_path = data.value("ytdlp_path", ytdlp_path);
    min_duration_seconds = data.value("min_duration_seconds", min_duration_seconds);
    max_duration_seconds = data.value("max_duration_seconds", max_duration_seconds);
    download_timeout_seconds = data.value("download_timeout_seconds", download_timeout_seconds);
    metadata_timeout_seconds = data.value("metadata_timeout_seconds", metadata_timeout_seconds);
    serve_metadata_timeout_seconds = data.value("serve_metadata_timeout_seconds", serve_metadata_timeout_seconds);

    queue_capacity = data.value("queue_capacity", queue_capacity);
    cache_capacity = data.value("cache_capacity", cache_capacity);
    history_capacity = data.value("history_capacity", history_capacity);
    seen_capacity = data.value("seen_capacity", seen_capacity);

    disk_quota_mb = data.value("disk_quota_mb", disk_quota_mb);
    disk_reserve_mb = data.value("disk_reserve_mb", disk_reserve_mb);
    maintenance_interval_seconds = data.value("maintenance_interval_seconds", maintenance_interval_seconds);
    refill_interval_ms = data.value("refill_interval_ms", refill_interval_ms);
    refill_backoff_ms = data.value("refill_backoff_ms", refill_backoff_ms);
    restart_preload_threshold = data.value("restart_preload_threshold", restart_preload_threshold);
    memory_soft_limit_mb = data.value("memory_soft_limit_mb", memory_soft_limit_mb);
    post_flow_timeout_minutes = data.value("post_flow_timeout_minutes", post_flow_timeout_minutes);

    if (queue_capacity < 1 || cache_capacity < 1 || history_capacity < 1 || seen_capacity < 1) {
        throw std::runtime_error("Container capacities must be at least 1");
    }

    // Write back missing keys so existing config.json reflects newly added options.
    // This is non-destructive: preserves unknown keys and only appends missing ones.
    bool changed = false;
    for (const auto& item : ToJson().items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);

        std::ofstream o(path, std::ios::trunc);
        if (o.is_open()) {
            o << std::setw(4) << data << std::endl;
        }
        // A read-only config still loads; only the write-back is skipped.
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    nlohmann::json data = Config{}.ToJson();

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
