#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include "../interfaces/IArtifactDownloader.hpp"
#include "../interfaces/IMetadataExtractor.hpp"

namespace ClipRelay {

struct YtDlpOptions {
    std::string binary = "yt-dlp";
    std::string cookies_file = "cookies.txt";
    std::filesystem::path output_dir = "downloads";
    double min_duration_seconds = 5.0;
    double max_duration_seconds = 50.0;
    std::chrono::seconds download_timeout{180};
    std::chrono::seconds metadata_timeout{12};
    double large_file_warn_mb = 50.0;
};

// Downloads videos and reads their metadata through the yt-dlp command line tool.
class YtDlpDownloader : public IArtifactDownloader, public IMetadataExtractor {
public:
    explicit YtDlpDownloader(YtDlpOptions options);

    std::filesystem::path TargetPath(const ContentRef& ref) const override;
    DownloadResult Download(const ContentRef& ref) override;
    std::optional<VideoMetadata> Extract(const ContentRef& ref, std::chrono::seconds timeout) override;

    // True when the duration is unknown or inside the accepted window.
    bool DurationAccepted(const VideoMetadata& metadata) const;

private:
    YtDlpOptions options_;
};

}
