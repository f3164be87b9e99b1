#include "YtDlpDownloader.hpp"
#include "../parser/YtDlpMetadataParser.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Subprocess.hpp"
#include "../utils/UrlUtil.hpp"
#include <cstdio>

namespace ClipRelay {

namespace fs = std::filesystem;

YtDlpDownloader::YtDlpDownloader(YtDlpOptions options) : options_(std::move(options)) {}

fs::path YtDlpDownloader::TargetPath(const ContentRef& ref) const {
    return options_.output_dir / (UrlUtil::VideoIdFromUrl(ref) + ".mp4");
}

bool YtDlpDownloader::DurationAccepted(const VideoMetadata& metadata) const {
    if (!metadata.duration) return true;
    return *metadata.duration >= options_.min_duration_seconds && *metadata.duration <= options_.max_duration_seconds;
}

std::optional<VideoMetadata> YtDlpDownloader::Extract(const ContentRef& ref, std::chrono::seconds timeout) {
    auto res = RunProcess({options_.binary, "--dump-json", "--cookies", options_.cookies_file, ref}, timeout);
    if (res.timed_out) {
        Logger::Log(LogLevel::Error, "yt-dlp timed out extracting metadata for " + ref);
        return std::nullopt;
    }
    if (!res.Ok()) {
        Logger::Log(LogLevel::Error, "yt-dlp returned non-zero for metadata " + ref + " (exit " + std::to_string(res.exit_code) + ") " + res.error);
        return std::nullopt;
    }
    auto meta = YtDlpMetadataParser::Parse(res.output);
    if (!meta) {
        Logger::Log(LogLevel::Error, "Failed to parse metadata for " + ref);
    }
    return meta;
}

DownloadResult YtDlpDownloader::Download(const ContentRef& ref) {
    DownloadResult result;

    std::error_code ec;
    fs::create_directories(options_.output_dir, ec);

    auto metadata = Extract(ref, options_.metadata_timeout);
    if (metadata && !DurationAccepted(*metadata)) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.1f", *metadata->duration);
        result.kind = ErrorKind::Rejected;
        result.error = std::string("Duration ") + buf + "s not in " + std::to_string(static_cast<int>(options_.min_duration_seconds)) +
                       "-" + std::to_string(static_cast<int>(options_.max_duration_seconds)) + "s";
        return result;
    }

    const fs::path output_path = TargetPath(ref);
    auto res = RunProcess({options_.binary, "--no-part", "--no-mtime", "--cookies", options_.cookies_file,
                           "-o", output_path.string(), ref}, options_.download_timeout);
    if (res.timed_out) {
        result.kind = ErrorKind::Timeout;
        result.error = "yt-dlp timed out downloading " + ref;
        return result;
    }
    if (!res.Ok()) {
        result.kind = ErrorKind::Transient;
        result.error = "yt-dlp returned error downloading " + ref + " (exit " + std::to_string(res.exit_code) + ")" +
                       (res.error.empty() ? "" : ": " + res.error);
        return result;
    }

    auto size = fs::file_size(output_path, ec);
    if (ec) {
        result.kind = ErrorKind::Transient;
        result.error = "Downloaded file missing: " + output_path.string();
        return result;
    }
    double size_mb = static_cast<double>(size) / (1024.0 * 1024.0);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", size_mb);
    Logger::Log(LogLevel::Info, "Video downloaded successfully to " + output_path.string() + " (" + buf + " MB)");
    if (size_mb > options_.large_file_warn_mb) {
        Logger::Log(LogLevel::Warn, std::string("Large video file (") + buf + " MB) may slow chat upload");
    }

    result.artifact = Artifact{output_path, ref};
    result.metadata = metadata;
    return result;
}

}
