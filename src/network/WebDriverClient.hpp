#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace ClipRelay {

// Minimal synchronous W3C WebDriver transport. Each call uses its own cURL
// easy handle, so one client may be shared between threads.
class WebDriverClient {
public:
    WebDriverClient(std::string base_url, long timeout_ms, std::string user_agent = "ClipRelay/1.0");

    WebDriverClient(const WebDriverClient&) = delete;
    WebDriverClient& operator=(const WebDriverClient&) = delete;

    // Each returns the response's "value" member.
    // Throws PipelineError(Timeout) or PipelineError(Transient).
    nlohmann::json Get(const std::string& path);
    nlohmann::json Post(const std::string& path, const nlohmann::json& body);
    nlohmann::json Delete(const std::string& path);

    const std::string& BaseUrl() const { return base_url_; }

private:
    nlohmann::json Request(const char* method, const std::string& path, const nlohmann::json* body);

    std::string base_url_;
    long timeout_ms_;
    std::string user_agent_;
};

}
