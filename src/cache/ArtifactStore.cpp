#include "ArtifactStore.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <system_error>

namespace ClipRelay {

namespace fs = std::filesystem;

static inline std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

ArtifactStore::ArtifactStore(fs::path output_dir, std::string extension)
    : output_dir_(std::move(output_dir)), extension_(ToLower(std::move(extension))) {
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        Logger::Log(LogLevel::Warn, "Could not create output directory " + output_dir_.string() + ": " + ec.message());
    }
}

bool ArtifactStore::IsTrackedFile(const fs::path& p) const {
    return ToLower(p.extension().string()) == extension_;
}

std::string ArtifactStore::Key(const fs::path& p) {
    return p.lexically_normal().string();
}

void ArtifactStore::Remember(const fs::path& p, VideoMetadata metadata) {
    metadata_[Key(p)] = std::move(metadata);
}

std::optional<VideoMetadata> ArtifactStore::Metadata(const fs::path& p) const {
    auto it = metadata_.find(Key(p));
    if (it == metadata_.end()) return std::nullopt;
    return it->second;
}

bool ArtifactStore::HasMetadata(const fs::path& p) const {
    return metadata_.count(Key(p)) > 0;
}

void ArtifactStore::Discard(const fs::path& p) {
    metadata_.erase(Key(p));
    if (p.empty()) return;

    std::error_code ec;
    bool removed = fs::remove(p, ec);
    if (ec) {
        Logger::Log(LogLevel::Warn, "Failed to delete " + p.string() + ": " + ec.message());
    } else if (removed) {
        Logger::Log(LogLevel::Info, "Deleted file: " + p.string());
    } else {
        Logger::Log(LogLevel::Debug, "File already gone: " + p.string());
    }
}

std::vector<fs::path> ArtifactStore::ListTrackedFiles() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(output_dir_, ec)) return files;

    fs::directory_iterator it(output_dir_, ec);
    if (ec) {
        Logger::Log(LogLevel::Warn, "Cannot list " + output_dir_.string() + ": " + ec.message());
        return files;
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec) continue;
        if (IsTrackedFile(entry.path())) files.push_back(entry.path());
    }
    return files;
}

std::uint64_t ArtifactStore::TrackedBytes() const {
    std::uint64_t total = 0;
    for (const auto& file : ListTrackedFiles()) {
        std::error_code ec;
        auto size = fs::file_size(file, ec);
        if (!ec) total += size;
    }
    return total;
}

size_t ArtifactStore::SweepUntracked(const PathSet& keep) {
    size_t removed = 0;
    for (const auto& file : ListTrackedFiles()) {
        if (keep.count(Key(file))) continue;
        Discard(file);
        ++removed;
    }
    return removed;
}

std::optional<fs::path> ArtifactStore::OldestUnprotected(const PathSet& keep) const {
    std::optional<fs::path> oldest;
    fs::file_time_type oldest_time{};
    for (const auto& file : ListTrackedFiles()) {
        if (keep.count(Key(file))) continue;
        std::error_code ec;
        auto mtime = fs::last_write_time(file, ec);
        if (ec) continue;
        if (!oldest || mtime < oldest_time) {
            oldest = file;
            oldest_time = mtime;
        }
    }
    return oldest;
}

}
