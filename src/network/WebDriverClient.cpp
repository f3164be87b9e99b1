#include "WebDriverClient.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <algorithm>
#include <new>
#include "../core/Errors.hpp"
#include "../utils/Logger.hpp"

namespace {

// Page sources of infinite-scroll feeds grow large; cap what we keep.
constexpr size_t kMaxResponseBytes = 64 * 1024 * 1024;

struct TransferContext {
    std::string buffer;
    bool truncated = false;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    size_t remaining_space = kMaxResponseBytes > ctx->buffer.size() ? kMaxResponseBytes - ctx->buffer.size() : 0;
    size_t to_copy = std::min(chunk, remaining_space);
    if (to_copy > 0) {
        try {
            ctx->buffer.append(static_cast<char*>(contents), to_copy);
        } catch (const std::bad_alloc&) {
            return 0; // Indicates an error
        }
    }
    if (to_copy < chunk) ctx->truncated = true;
    return chunk;
}

struct EasyHandle {
    CURL* curl = curl_easy_init();
    curl_slist* headers = nullptr;
    ~EasyHandle() {
        if (headers) curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
};

} // anonymous namespace

namespace ClipRelay {

WebDriverClient::WebDriverClient(std::string base_url, long timeout_ms, std::string user_agent)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms), user_agent_(std::move(user_agent)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

nlohmann::json WebDriverClient::Get(const std::string& path) {
    return Request("GET", path, nullptr);
}

nlohmann::json WebDriverClient::Post(const std::string& path, const nlohmann::json& body) {
    return Request("POST", path, &body);
}

nlohmann::json WebDriverClient::Delete(const std::string& path) {
    return Request("DELETE", path, nullptr);
}

nlohmann::json WebDriverClient::Request(const char* method, const std::string& path, const nlohmann::json* body) {
    EasyHandle h;
    if (!h.curl) {
        throw PipelineError(ErrorKind::Transient, "Failed to create cURL easy handle");
    }

    TransferContext ctx;
    const std::string url = base_url_ + path;
    const std::string payload = body ? body->dump() : std::string();

    curl_easy_setopt(h.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.curl, CURLOPT_CUSTOMREQUEST, method);
    curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h.curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(h.curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(h.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.curl, CURLOPT_ERRORBUFFER, ctx.error_buffer);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(h.curl, CURLOPT_PROTOCOLS, allowed_protocols);

    h.headers = curl_slist_append(h.headers, "Content-Type: application/json; charset=utf-8");
    h.headers = curl_slist_append(h.headers, "Accept: application/json");
    curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);
    if (body) {
        curl_easy_setopt(h.curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(h.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    }

    CURLcode rc = curl_easy_perform(h.curl);
    if (rc != CURLE_OK) {
        std::string err = ctx.error_buffer[0] ? ctx.error_buffer : curl_easy_strerror(rc);
        ErrorKind kind = rc == CURLE_OPERATION_TIMEDOUT ? ErrorKind::Timeout : ErrorKind::Transient;
        throw PipelineError(kind, std::string("WebDriver ") + method + " " + path + " failed: " + err);
    }
    if (ctx.truncated) {
        throw PipelineError(ErrorKind::Transient, std::string("WebDriver ") + method + " " + path + " response too large");
    }

    long status = 0;
    curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &status);

    nlohmann::json response = nlohmann::json::parse(ctx.buffer, nullptr, false);
    if (response.is_discarded()) {
        throw PipelineError(ErrorKind::Transient, std::string("WebDriver ") + method + " " + path +
                            " returned non-JSON body (HTTP " + std::to_string(status) + ")");
    }

    nlohmann::json value = response.contains("value") ? response["value"] : nlohmann::json();
    if (status >= 400 || (value.is_object() && value.contains("error"))) {
        std::string error = value.is_object() ? value.value("error", std::string("unknown error")) : "unknown error";
        std::string message = value.is_object() ? value.value("message", std::string()) : std::string();
        Logger::Log(LogLevel::Debug, "WebDriver error on " + path + ": " + error + " " + message);
        ErrorKind kind = error == "timeout" || error == "script timeout" ? ErrorKind::Timeout : ErrorKind::Transient;
        throw PipelineError(kind, "WebDriver " + error + ": " + message);
    }
    return value;
}

}
