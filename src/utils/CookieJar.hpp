#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ClipRelay {
    struct BrowserCookie {
        std::string name;
        std::string value;
        std::optional<std::string> domain;
        std::string path = "/";
        bool secure = false;
        bool http_only = false;
        std::optional<long long> expiry;
    };

    namespace CookieJar {
        // Browser-exported JSON array of cookies. Entries without name/value are skipped.
        std::vector<BrowserCookie> Parse(const nlohmann::json& data);
        std::vector<BrowserCookie> Load(const std::string& json_file); // throws std::runtime_error

        // Netscape cookies.txt body for command line downloaders.
        std::string ToNetscape(const std::vector<BrowserCookie>& cookies, const std::string& default_domain);
        void ConvertToNetscape(const std::string& json_file, const std::string& txt_file, const std::string& default_domain);

        // WebDriver "add cookie" payload.
        nlohmann::json ToWebDriver(const BrowserCookie& cookie);
    }
}
