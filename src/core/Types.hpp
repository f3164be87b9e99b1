#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ClipRelay {
    // Remote content identifier (a video page URL).
    using ContentRef = std::string;

    // Chat-side identifiers (Discord snowflakes).
    using RequesterId = std::uint64_t;
    using MessageId = std::uint64_t;

    struct VideoMetadata {
        std::optional<double> duration; // seconds, unknown when extraction failed
        std::string caption;
        std::vector<std::string> hashtags; // ordered, no duplicates
    };

    // Handle to a downloaded file. Exactly one container owns it at a time.
    struct Artifact {
        std::filesystem::path path;
        ContentRef source;

        bool operator==(const Artifact& other) const { return path == other.path; }
        bool operator!=(const Artifact& other) const { return !(*this == other); }
    };
}
