#include "BrowserSession.hpp"
#include "../core/Errors.hpp"
#include "../utils/CookieJar.hpp"
#include "../utils/Logger.hpp"
#include <thread>

namespace ClipRelay {

namespace {

// W3C element reference key.
const char* kElementKey = "element-6066-11e4-a52e-4f735466cecf";

// Splits UTF-8 text into code points so each can be typed separately.
std::vector<std::string> SplitCodePoints(const std::string& text) {
    std::vector<std::string> out;
    for (size_t i = 0; i < text.size();) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = (c < 0x80) ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 1;
        out.push_back(text.substr(i, len));
        i += len;
    }
    return out;
}

}

BrowserSession::BrowserSession(WebDriverClient& client, BrowserOptions options)
    : client_(client), options_(std::move(options)), rng_(std::random_device{}()) {}

BrowserSession::~BrowserSession() {
    try {
        Stop();
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Failed to close browser session on exit: " + std::string(e.what()));
    }
}

void BrowserSession::Start() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!session_id_.empty()) return;

    nlohmann::json args = nlohmann::json::array({
        "--width=" + std::to_string(options_.window_width),
        "--height=" + std::to_string(options_.window_height)
    });
    if (options_.headless) args.push_back("-headless");

    nlohmann::json caps;
    caps["capabilities"]["alwaysMatch"]["browserName"] = "firefox";
    caps["capabilities"]["alwaysMatch"]["moz:firefoxOptions"]["args"] = args;

    nlohmann::json value;
    try {
        value = client_.Post("/session", caps);
    } catch (const PipelineError& e) {
        throw PipelineError(ErrorKind::Fatal, std::string("Failed to start Firefox WebDriver: ") + e.what());
    }
    if (!value.is_object() || !value.contains("sessionId") || !value["sessionId"].is_string()) {
        throw PipelineError(ErrorKind::Fatal, "WebDriver did not return a session id");
    }
    session_id_ = value["sessionId"].get<std::string>();

    process_id_ = 0;
    if (value.contains("capabilities") && value["capabilities"].is_object()) {
        const auto& c = value["capabilities"];
        if (c.contains("moz:processID") && c["moz:processID"].is_number_integer()) {
            process_id_ = c["moz:processID"].get<int>();
        }
    }
    Logger::Log(LogLevel::Info, "Firefox WebDriver started (session " + session_id_ + ")");
}

void BrowserSession::ApplyStoredCredentials() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<BrowserCookie> cookies;
    try {
        cookies = CookieJar::Load(options_.cookies_file);
    } catch (const std::exception& e) {
        throw PipelineError(ErrorKind::Fatal, e.what());
    }

    Navigate(options_.homepage_url);
    size_t applied = 0;
    for (const auto& cookie : cookies) {
        try {
            client_.Post(SessionPath() + "/cookie", {{"cookie", CookieJar::ToWebDriver(cookie)}});
            ++applied;
        } catch (const PipelineError& e) {
            Logger::Log(LogLevel::Warn, "Failed to add cookie " + cookie.name + ": " + e.what());
        }
    }
    Refresh();
    Logger::Log(LogLevel::Info, "Applied " + std::to_string(applied) + "/" + std::to_string(cookies.size()) + " cookies.");
}

void BrowserSession::Stop() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (session_id_.empty()) return;
    std::string path = SessionPath();
    session_id_.clear();
    process_id_ = 0;
    client_.Delete(path);
    Logger::Log(LogLevel::Info, "Firefox WebDriver closed");
}

bool BrowserSession::IsRunning() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return !session_id_.empty();
}

std::optional<int> BrowserSession::ProcessId() const {
    int pid = process_id_.load();
    if (pid <= 0) return std::nullopt;
    return pid;
}

std::unique_lock<std::recursive_mutex> BrowserSession::Acquire() {
    return std::unique_lock<std::recursive_mutex>(mutex_);
}

std::string BrowserSession::SessionPath() const {
    if (session_id_.empty()) {
        throw PipelineError(ErrorKind::Transient, "Browser session is not running");
    }
    return "/session/" + session_id_;
}

void BrowserSession::Navigate(const std::string& url) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    client_.Post(SessionPath() + "/url", {{"url", url}});
}

void BrowserSession::Refresh() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    client_.Post(SessionPath() + "/refresh", nlohmann::json::object());
}

nlohmann::json BrowserSession::ExecuteScript(const std::string& script, const nlohmann::json& args) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return client_.Post(SessionPath() + "/execute/sync", {{"script", script}, {"args", args}});
}

std::string BrowserSession::PageSource() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto value = client_.Get(SessionPath() + "/source");
    return value.is_string() ? value.get<std::string>() : std::string();
}

std::string BrowserSession::FindElement(const std::string& strategy, const std::string& selector) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto value = client_.Post(SessionPath() + "/element", {{"using", strategy}, {"value", selector}});
    if (!value.is_object() || !value.contains(kElementKey)) {
        throw PipelineError(ErrorKind::Transient, "No element reference for " + selector);
    }
    return value[kElementKey].get<std::string>();
}

std::string BrowserSession::WaitForElement(const std::string& strategy, const std::string& selector, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        try {
            return FindElement(strategy, selector);
        } catch (const PipelineError& e) {
            if (std::chrono::steady_clock::now() >= deadline) {
                throw PipelineError(ErrorKind::Timeout, "Timed out waiting for " + selector + ": " + e.what());
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
}

void BrowserSession::SendKeys(const std::string& element_id, const std::string& text) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    client_.Post(SessionPath() + "/element/" + element_id + "/value", {{"text", text}});
}

void BrowserSession::Click(const std::string& element_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    client_.Post(SessionPath() + "/element/" + element_id + "/click", nlohmann::json::object());
}

void BrowserSession::PauseRandom(int min_ms, int max_ms) {
    if (max_ms < min_ms) std::swap(min_ms, max_ms);
    std::uniform_int_distribution<int> dist(min_ms, max_ms);
    int ms = 0;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ms = dist(rng_);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

bool BrowserSession::Publish(const std::filesystem::path& file, const std::string& comment, const std::vector<std::string>& hashtags) {
    auto session_lock = Acquire();
    try {
        Navigate(options_.homepage_url);
        PauseRandom(1000, 2000);

        std::string file_input = WaitForElement("css selector", "input[type=\"file\"]", options_.element_wait);
        SendKeys(file_input, std::filesystem::absolute(file).string());
        PauseRandom(2000, 4000);

        std::string caption_elem = WaitForElement("css selector", "[contenteditable=\"true\"]", options_.element_wait);
        std::string full_caption = comment;
        for (const auto& tag : hashtags) full_caption += " " + tag;
        for (const auto& ch : SplitCodePoints(full_caption)) {
            SendKeys(caption_elem, ch);
            PauseRandom(20, 80);
        }

        PauseRandom(1000, 3000);
        std::string post_button = WaitForElement("xpath", "//button[contains(text(), \"Post\")]", options_.element_wait);
        Click(post_button);
        std::this_thread::sleep_for(std::chrono::seconds(5));
        Logger::Log(LogLevel::Info, "Posted video " + file.string() + " via WebDriver.");
        return true;
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Posting " + file.string() + " failed: " + e.what());
        return false;
    }
}

}
