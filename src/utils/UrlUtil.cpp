#include "UrlUtil.hpp"
#include <algorithm>
#include <cstring>

namespace ClipRelay {
namespace UrlUtil {

static inline bool starts_with(const std::string& s, const char* pfx) {
    size_t n = strlen(pfx);
    return s.size() >= n && memcmp(s.data(), pfx, n) == 0;
}

static inline std::string get_scheme_host(const std::string& url) {
    // Very small parser: scheme://host[:port]
    auto pos_scheme = url.find("://");
    if (pos_scheme == std::string::npos) return {};
    auto start_host = pos_scheme + 3;
    auto pos_end = url.find_first_of("/\\?#", start_host);
    if (pos_end == std::string::npos) pos_end = url.size();
    return url.substr(0, pos_end);
}

static inline std::string get_base_dir(const std::string& url) {
    // Returns scheme://host[:port]/path/dir (without filename)
    auto scheme_host = get_scheme_host(url);
    if (scheme_host.empty()) return {};
    std::string rest = url.substr(scheme_host.size());
    auto qpos = rest.find_first_of("?#");
    if (qpos != std::string::npos) rest = rest.substr(0, qpos);
    if (!rest.empty()) {
        if (rest.back() != '/') {
            auto slash = rest.find_last_of('/');
            if (slash != std::string::npos) rest = rest.substr(0, slash + 1);
            else rest = "/";
        }
    } else {
        rest = "/";
    }
    return scheme_host + rest;
}

std::string ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    if (candidate.empty()) return candidate;
    if (starts_with(candidate, "http://") || starts_with(candidate, "https://")) return candidate;
    if (starts_with(candidate, "//")) return std::string("https:") + candidate;

    auto scheme_host = get_scheme_host(base_url);
    if (scheme_host.empty()) return candidate; // fallback

    if (candidate[0] == '/') {
        return scheme_host + candidate;
    }

    auto base_dir = get_base_dir(base_url);
    if (base_dir.empty()) return candidate;
    if (base_dir.back() != '/') {
        return base_dir + "/" + candidate;
    }
    return base_dir + candidate;
}

static inline std::string strip_query(const std::string& url) {
    auto qpos = url.find_first_of("?#");
    return qpos == std::string::npos ? url : url.substr(0, qpos);
}

bool IsVideoLink(const std::string& url) {
    return strip_query(url).find("/video/") != std::string::npos;
}

std::string VideoIdFromUrl(const std::string& url) {
    std::string path = strip_query(url);
    while (!path.empty() && path.back() == '/') path.pop_back();
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string VideoPageUrl(const std::string& homepage, const std::string& video_id) {
    std::string base = get_scheme_host(homepage);
    if (base.empty()) base = homepage;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/video/" + video_id;
}

std::string HostOf(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return {};
    auto start = scheme_end + 3;
    auto end = url.find_first_of("/\\?#:", start);
    if (end == std::string::npos) end = url.size();
    std::string host = url.substr(start, end - start);
    std::transform(host.begin(), host.end(), host.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return host;
}

}
}
