#include "CookieJar.hpp"
#include "Logger.hpp"
#include <fstream>
#include <stdexcept>

namespace ClipRelay {
namespace CookieJar {

std::vector<BrowserCookie> Parse(const nlohmann::json& data) {
    std::vector<BrowserCookie> cookies;
    if (!data.is_array()) return cookies;

    for (const auto& c : data) {
        if (!c.is_object()) continue;
        if (!c.contains("name") || !c["name"].is_string()) continue;
        if (!c.contains("value") || !c["value"].is_string()) continue;

        BrowserCookie cookie;
        cookie.name = c["name"].get<std::string>();
        cookie.value = c["value"].get<std::string>();
        if (c.contains("domain") && c["domain"].is_string()) cookie.domain = c["domain"].get<std::string>();
        cookie.path = c.value("path", std::string("/"));
        cookie.secure = c.value("secure", false);
        cookie.http_only = c.value("httpOnly", false);
        // Exports use either "expiry" (WebDriver) or "expirationDate" (extensions).
        for (const char* key : {"expiry", "expirationDate"}) {
            if (c.contains(key) && c[key].is_number()) {
                cookie.expiry = static_cast<long long>(c[key].get<double>());
                break;
            }
        }
        cookies.push_back(std::move(cookie));
    }
    return cookies;
}

std::vector<BrowserCookie> Load(const std::string& json_file) {
    std::ifstream f(json_file);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open cookies file: " + json_file);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid cookies file " + json_file + ": " + e.what());
    }
    auto cookies = Parse(data);
    Logger::Log(LogLevel::Info, "Loaded " + std::to_string(cookies.size()) + " cookies");
    return cookies;
}

std::string ToNetscape(const std::vector<BrowserCookie>& cookies, const std::string& default_domain) {
    std::string out = "# Netscape HTTP Cookie File\n";
    for (const auto& c : cookies) {
        out += c.domain ? *c.domain : default_domain;
        out += "\tTRUE\t";
        out += c.path;
        out += '\t';
        out += c.secure ? "TRUE" : "FALSE";
        out += '\t';
        out += std::to_string(c.expiry ? *c.expiry : 2147483647LL);
        out += '\t';
        out += c.name;
        out += '\t';
        out += c.value;
        out += '\n';
    }
    return out;
}

void ConvertToNetscape(const std::string& json_file, const std::string& txt_file, const std::string& default_domain) {
    Logger::Log(LogLevel::Info, "Converting JSON cookies " + json_file + " to Netscape format " + txt_file + "...");
    auto cookies = Load(json_file);
    std::ofstream o(txt_file, std::ios::trunc);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open cookie file for writing: " + txt_file);
    }
    o << ToNetscape(cookies, default_domain);
    if (!o.good()) {
        throw std::runtime_error("Failed to write cookie file: " + txt_file);
    }
    Logger::Log(LogLevel::Info, "Cookie conversion completed.");
}

nlohmann::json ToWebDriver(const BrowserCookie& cookie) {
    nlohmann::json j;
    j["name"] = cookie.name;
    j["value"] = cookie.value;
    j["path"] = cookie.path;
    j["secure"] = cookie.secure;
    j["httpOnly"] = cookie.http_only;
    if (cookie.domain) j["domain"] = *cookie.domain;
    if (cookie.expiry) j["expiry"] = *cookie.expiry;
    return j;
}

}
}
