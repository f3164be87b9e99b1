#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <nlohmann/json.hpp>
#include "WebDriverClient.hpp"
#include "../interfaces/IPostPublisher.hpp"
#include "../interfaces/IRuntimeSession.hpp"

namespace ClipRelay {

struct BrowserOptions {
    std::string homepage_url = "https://www.tiktok.com/";
    std::string cookies_file = "cookies.json";
    std::string cookie_default_domain;
    int window_width = 1200;
    int window_height = 900;
    bool headless = true;
    std::chrono::milliseconds element_wait{15000};
};

// A Firefox session driven over WebDriver. Commands are serialized; use
// Acquire() to hold the session across a multi-step sequence.
class BrowserSession : public IRuntimeSession, public IPostPublisher {
public:
    BrowserSession(WebDriverClient& client, BrowserOptions options);
    ~BrowserSession() override;

    BrowserSession(const BrowserSession&) = delete;
    BrowserSession& operator=(const BrowserSession&) = delete;

    void Start() override;
    void ApplyStoredCredentials() override;
    void Stop() override;
    bool IsRunning() const override;

    bool Publish(const std::filesystem::path& file, const std::string& comment, const std::vector<std::string>& hashtags) override;

    void Navigate(const std::string& url);
    void Refresh();
    nlohmann::json ExecuteScript(const std::string& script, const nlohmann::json& args = nlohmann::json::array());
    std::string PageSource();
    std::string FindElement(const std::string& strategy, const std::string& selector);
    std::string WaitForElement(const std::string& strategy, const std::string& selector, std::chrono::milliseconds timeout);
    void SendKeys(const std::string& element_id, const std::string& text);
    void Click(const std::string& element_id);

    // Browser pid reported by the driver, if any.
    std::optional<int> ProcessId() const;
    std::unique_lock<std::recursive_mutex> Acquire();
    const BrowserOptions& Options() const { return options_; }

    void PauseRandom(int min_ms, int max_ms);

private:
    std::string SessionPath() const;

    WebDriverClient& client_;
    BrowserOptions options_;
    mutable std::recursive_mutex mutex_;
    std::string session_id_;
    std::atomic<int> process_id_{0};
    std::mt19937 rng_;
};

}
