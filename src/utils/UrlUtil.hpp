#pragma once
#include <string>
#include <vector>

namespace ClipRelay {
namespace UrlUtil {

// Resolve possibly-relative or protocol-relative URL against a base URL (page URL).
// Rules:
// - If candidate starts with http:// or https://, return as-is.
// - If candidate starts with //, prefix https:.
// - If candidate starts with /, return base_scheme://base_host + candidate.
// - Otherwise, append to base directory: base_scheme://base_host/base_dir/ + candidate.
// On parse failure, returns candidate unchanged.
std::string ResolveAgainst(const std::string& base_url, const std::string& candidate);

// True for links to a single video page (path contains "/video/").
bool IsVideoLink(const std::string& url);

// Last path segment with query, fragment and trailing slashes removed.
// "https://host/@user/video/123?lang=en" -> "123"
std::string VideoIdFromUrl(const std::string& url);

// <homepage>/video/<id>
std::string VideoPageUrl(const std::string& homepage, const std::string& video_id);

// Lowercase host of an absolute URL, empty if none.
std::string HostOf(const std::string& url);

}
}
