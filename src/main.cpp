#include <dpp/dpp.h>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <pthread.h>
#include "../config/Config.hpp"
#include "bot/DiscordChannel.hpp"
#include "core/DiskBudgetEnforcer.hpp"
#include "core/Errors.hpp"
#include "core/JobScheduler.hpp"
#include "core/NavigationHandler.hpp"
#include "core/PipelineOrchestrator.hpp"
#include "core/PipelineState.hpp"
#include "core/PostFlow.hpp"
#include "core/RuntimeRecycler.hpp"
#include "media/YtDlpDownloader.hpp"
#include "network/BrowserSession.hpp"
#include "network/VideoLinkScraper.hpp"
#include "network/WebDriverClient.hpp"
#include "utils/CookieJar.hpp"
#include "utils/DiskSpace.hpp"
#include "utils/Logger.hpp"
#include "utils/ProcessMemory.hpp"
#include "utils/ThreadPool.hpp"
#include "utils/UrlUtil.hpp"

using namespace ClipRelay;

namespace {
const char* kWelcome = "Welcome! Here is your first video.";

unsigned int WorkerThreads(int configured, bool& ok) {
    const unsigned int hardware_cores = std::max(1u, std::thread::hardware_concurrency());
    ok = true;
    if (configured == 0) {
        unsigned int threads = std::max(2u, hardware_cores / 2);
        Logger::Log(LogLevel::Info, "max_concurrency is 0, defaulting to half of system cores: " + std::to_string(threads));
        return threads;
    }
    if (configured < 0 || static_cast<unsigned int>(configured) > hardware_cores) {
        Logger::Log(LogLevel::Error, "Configured max_concurrency (" + std::to_string(configured) + ") must be between 1 and the number of system cores (" + std::to_string(hardware_cores) + ").");
        ok = false;
        return 0;
    }
    Logger::Log(LogLevel::Info, "Using configured max_concurrency: " + std::to_string(configured));
    return static_cast<unsigned int>(configured);
}

LogLevel FromDppSeverity(dpp::loglevel severity) {
    switch (severity) {
        case dpp::ll_info:     return LogLevel::Info;
        case dpp::ll_warning:  return LogLevel::Warn;
        case dpp::ll_error:
        case dpp::ll_critical: return LogLevel::Error;
        default:               return LogLevel::Debug;
    }
}
}

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        Logger::Log(LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    const std::string config_path = (exe_dir / "config" / "config.json").string();

    // Every thread created from here on inherits the mask; sigwait below collects them.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    curl_global_init(CURL_GLOBAL_ALL);

    try {
        Config::GetInstance().Load(config_path);
        Logger::Log(LogLevel::Info, "Configuration loaded from: " + config_path);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") == std::string::npos) {
            Logger::Log(LogLevel::Error, "Failed to load config: " + error_message);
            curl_global_cleanup();
            return 1;
        }
        Logger::Log(LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path);
        try {
            Config::GetInstance().CreateDefault(config_path);
            Logger::Log(LogLevel::Info, "Default config.json created. Set bot_token and channel_id, then restart.");
            curl_global_cleanup();
            return 0;
        } catch (const std::exception& create_e) {
            Logger::Log(LogLevel::Error, "Failed to create default config: " + std::string(create_e.what()));
            curl_global_cleanup();
            return 1;
        }
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Failed to parse config: " + std::string(e.what()));
        curl_global_cleanup();
        return 1;
    }
    const auto& config = Config::GetInstance();
    Logger::Init(exe_dir.string(), Logger::FromString(config.log_level));

    if (config.bot_token == "YOUR_BOT_TOKEN_HERE" || config.bot_token.empty() || config.channel_id == 0) {
        Logger::Log(LogLevel::Error, "Please set bot_token and channel_id in " + config_path);
        curl_global_cleanup();
        return 1;
    }

    bool threads_ok = false;
    const unsigned int worker_threads = WorkerThreads(config.max_concurrency, threads_ok);
    if (!threads_ok) {
        curl_global_cleanup();
        return 1;
    }

    std::string cookie_host = UrlUtil::HostOf(config.homepage_url);
    if (cookie_host.rfind("www.", 0) == 0) cookie_host = cookie_host.substr(4);
    const std::string cookie_domain = "." + cookie_host;
    try {
        CookieJar::ConvertToNetscape(config.cookies_file, config.netscape_cookies_file, cookie_domain);
        Logger::Log(LogLevel::Info, "Converted " + config.cookies_file + " to " + config.netscape_cookies_file);
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Cookie conversion failed, downloads may be refused: " + std::string(e.what()));
    }

    // Browser and downloader
    WebDriverClient webdriver(config.webdriver_url, config.webdriver_timeout_ms);

    BrowserOptions browser_options;
    browser_options.homepage_url = config.homepage_url;
    browser_options.cookies_file = config.cookies_file;
    browser_options.cookie_default_domain = cookie_domain;
    browser_options.headless = config.browser_headless;
    BrowserSession browser(webdriver, browser_options);

    ScrapeOptions scrape_options;
    scrape_options.retries = config.discovery_retries;
    scrape_options.scroll_min_px = config.scroll_min_px;
    scrape_options.scroll_max_px = config.scroll_max_px;
    scrape_options.pause_min_ms = config.scroll_pause_min_ms;
    scrape_options.pause_max_ms = config.scroll_pause_max_ms;
    VideoLinkScraper scraper(browser, scrape_options);

    YtDlpOptions ytdlp_options;
    ytdlp_options.binary = config.ytdlp_path;
    ytdlp_options.cookies_file = config.netscape_cookies_file;
    ytdlp_options.output_dir = config.output_dir;
    ytdlp_options.min_duration_seconds = config.min_duration_seconds;
    ytdlp_options.max_duration_seconds = config.max_duration_seconds;
    ytdlp_options.download_timeout = std::chrono::seconds(config.download_timeout_seconds);
    ytdlp_options.metadata_timeout = std::chrono::seconds(config.metadata_timeout_seconds);
    YtDlpDownloader downloader(ytdlp_options);

    // Pipeline
    PipelineLimits limits;
    limits.queue_capacity = static_cast<size_t>(config.queue_capacity);
    limits.cache_capacity = static_cast<size_t>(config.cache_capacity);
    limits.history_capacity = static_cast<size_t>(config.history_capacity);
    limits.seen_capacity = static_cast<size_t>(config.seen_capacity);
    PipelineState state(limits, config.output_dir);

    FilesystemSpaceProbe space_probe;
    DiskBudgetEnforcer enforcer(
        DiskBudget::FromMegabytes(static_cast<std::uint64_t>(std::max(0L, config.disk_quota_mb)),
                                  static_cast<std::uint64_t>(std::max(0L, config.disk_reserve_mb))),
        space_probe);

    ProcessMemoryProbe memory_probe([&browser]() { return browser.ProcessId(); });
    RecyclePolicy recycle_policy;
    recycle_policy.restart_preload_threshold = config.restart_preload_threshold;
    recycle_policy.memory_soft_limit_mb = config.memory_soft_limit_mb;
    RuntimeRecycler recycler(browser, memory_probe, recycle_policy);

    OrchestratorOptions orchestrator_options;
    orchestrator_options.homepage_url = config.homepage_url;
    orchestrator_options.serve_metadata_timeout = std::chrono::seconds(config.serve_metadata_timeout_seconds);
    orchestrator_options.refill_interval = std::chrono::milliseconds(config.refill_interval_ms);
    orchestrator_options.refill_backoff = std::chrono::milliseconds(config.refill_backoff_ms);
    orchestrator_options.maintenance_interval = std::chrono::seconds(config.maintenance_interval_seconds);
    PipelineOrchestrator orchestrator(state, scraper, downloader, downloader, recycler, enforcer, orchestrator_options);

    PostFlowRegistry post_flows;
    const auto post_flow_timeout = std::chrono::minutes(config.post_flow_timeout_minutes);
    orchestrator.AddMaintenanceStep("post flow expiry", [&post_flows, post_flow_timeout]() {
        size_t expired = post_flows.ExpireOlderThan(post_flow_timeout);
        if (expired > 0) {
            Logger::Log(LogLevel::Info, "Abandoned " + std::to_string(expired) + " stale post flow(s)");
        }
    });

    try {
        orchestrator.Startup();
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Startup failed: " + std::string(e.what()));
        orchestrator.Shutdown();
        curl_global_cleanup();
        return 1;
    }

    // Chat
    ThreadPool thread_pool(worker_threads);
    JobScheduler job_scheduler(thread_pool);

    dpp::cluster bot(config.bot_token, dpp::i_default_intents | dpp::i_message_content);
    bot.on_log([](const dpp::log_t& event) {
        Logger::Log(FromDppSeverity(event.severity), "[DPP] " + event.message);
    });

    DiscordChannel channel(bot, config.chat_timeout_ms);
    NavigationHandler::Options nav_options;
    nav_options.present_retries = config.present_retries;
    NavigationHandler handler(orchestrator, channel, post_flows, browser, thread_pool, nav_options);

    const RequesterId home_channel = config.channel_id;

    bot.on_button_click([&handler, &channel, &thread_pool, home_channel](const dpp::button_click_t& event) {
        if (static_cast<RequesterId>(event.command.channel_id) != home_channel) return;
        event.reply();
        auto signal = ParseSignal(event.custom_id);
        if (!signal) {
            Logger::Log(LogLevel::Warn, "Unknown button: " + event.custom_id);
            return;
        }
        channel.DeleteMessage(home_channel, static_cast<MessageId>(event.command.msg.id));
        try {
            thread_pool.enqueue([&handler, home_channel, s = *signal]() { handler.OnSignal(home_channel, s); });
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Warn, "Dropped button press: " + std::string(e.what()));
        }
    });

    bot.on_message_create([&handler, &thread_pool, home_channel](const dpp::message_create_t& event) {
        if (event.msg.author.is_bot()) return;
        if (static_cast<RequesterId>(event.msg.channel_id) != home_channel) return;
        try {
            thread_pool.enqueue([&handler, home_channel, text = event.msg.content]() { handler.OnText(home_channel, text); });
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Warn, "Dropped message: " + std::string(e.what()));
        }
    });

    std::atomic<bool> welcomed{false};
    bot.on_ready([&bot, &handler, &orchestrator, &job_scheduler, &thread_pool, &welcomed, home_channel](const dpp::ready_t&) {
        Logger::Log(LogLevel::Info, "Bot is ready! Logged in as " + bot.me.username);
        if (welcomed.exchange(true)) return;
        thread_pool.enqueue([&handler, &orchestrator, &job_scheduler, home_channel]() {
            if (!handler.PresentCurrent(home_channel, kWelcome)) {
                Logger::Log(LogLevel::Warn, "Could not present the first video");
            }
            orchestrator.ScheduleBackgroundTasks(job_scheduler);
        });
    });

    try {
        bot.start(dpp::st_return);
    } catch (const dpp::exception& e) {
        Logger::Log(LogLevel::Error, "DPP Exception: " + std::string(e.what()));
        orchestrator.Shutdown();
        job_scheduler.Stop();
        thread_pool.Shutdown();
        curl_global_cleanup();
        return 1;
    }

    int received = 0;
    sigwait(&stop_signals, &received);
    Logger::Log(LogLevel::Info, "Received signal " + std::to_string(received) + ", shutting down");

    orchestrator.Shutdown();
    job_scheduler.Stop();
    // Queued chat work captures the handler and channel by reference; finish it
    // while they and the bot are still alive.
    thread_pool.Shutdown();
    bot.shutdown();

    Logger::Log(LogLevel::Info, "Shutdown complete");
    Logger::Close();
    curl_global_cleanup();
    return 0;
}
