#pragma once
#include <chrono>
#include <optional>
#include "../core/Types.hpp"

namespace ClipRelay {

class IMetadataExtractor {
public:
    virtual ~IMetadataExtractor() = default;
    // Best effort; nullopt on failure or timeout.
    virtual std::optional<VideoMetadata> Extract(const ContentRef& ref, std::chrono::seconds timeout) = 0;
};

}
