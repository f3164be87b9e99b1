#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../core/Types.hpp"

namespace ClipRelay {
    class YtDlpMetadataParser {
    public:
        // Parses `yt-dlp --dump-json` output. nullopt when it is not a JSON object.
        static std::optional<VideoMetadata> Parse(const std::string& json_text);

        // "#\w+" matches in the description, then "#"-prefixed tags, first occurrence wins.
        static std::vector<std::string> CollectHashtags(const std::string& description, const std::vector<std::string>& tags);
    };
}
