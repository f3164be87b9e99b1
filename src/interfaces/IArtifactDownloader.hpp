#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "../core/Errors.hpp"
#include "../core/Types.hpp"

namespace ClipRelay {

struct DownloadResult {
    std::optional<Artifact> artifact;
    std::optional<VideoMetadata> metadata; // unknown when extraction failed
    ErrorKind kind = ErrorKind::None;
    std::string error;

    bool Ok() const { return artifact.has_value(); }
};

class IArtifactDownloader {
public:
    virtual ~IArtifactDownloader() = default;
    // Where Download(ref) will write its file.
    virtual std::filesystem::path TargetPath(const ContentRef& ref) const = 0;
    virtual DownloadResult Download(const ContentRef& ref) = 0;
};

}
