#include "YtDlpMetadataParser.hpp"
#include <nlohmann/json.hpp>
#include <regex>
#include <unordered_set>

namespace ClipRelay {

static inline std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::optional<VideoMetadata> YtDlpMetadataParser::Parse(const std::string& json_text) {
    // yt-dlp prints one object per line; the first line describes the video.
    auto line_end = json_text.find('\n');
    std::string first = line_end == std::string::npos ? json_text : json_text.substr(0, line_end);

    nlohmann::json data = nlohmann::json::parse(first, nullptr, false);
    if (data.is_discarded() || !data.is_object()) return std::nullopt;

    VideoMetadata meta;
    double duration = 0.0;
    if (data.contains("duration") && data["duration"].is_number()) {
        duration = data["duration"].get<double>();
    }
    meta.duration = duration;

    std::string description;
    if (data.contains("description") && data["description"].is_string()) {
        description = data["description"].get<std::string>();
    }
    meta.caption = Trim(description);

    std::vector<std::string> tags;
    if (data.contains("tags") && data["tags"].is_array()) {
        for (const auto& t : data["tags"]) {
            if (t.is_string()) tags.push_back(t.get<std::string>());
        }
    }
    meta.hashtags = CollectHashtags(description, tags);
    return meta;
}

std::vector<std::string> YtDlpMetadataParser::CollectHashtags(const std::string& description, const std::vector<std::string>& tags) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::string& tag) {
        if (seen.insert(tag).second) out.push_back(tag);
    };

    static const std::regex hashtag_regex(R"(#\w+)");
    for (auto it = std::sregex_iterator(description.begin(), description.end(), hashtag_regex); it != std::sregex_iterator(); ++it) {
        add(it->str());
    }
    for (const auto& t : tags) {
        if (!t.empty() && t[0] == '#') add(t);
    }
    return out;
}

}
