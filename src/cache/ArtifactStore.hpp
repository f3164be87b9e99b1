#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "../core/Types.hpp"

namespace ClipRelay {
    using PathSet = std::unordered_set<std::string>;

    // On-disk side of the pipeline: the output directory, the tracked file
    // extension and the metadata kept for each live artifact.
    // Not synchronized; callers hold the pipeline state lock.
    class ArtifactStore {
    public:
        explicit ArtifactStore(std::filesystem::path output_dir, std::string extension = ".mp4");

        const std::filesystem::path& Directory() const { return output_dir_; }
        bool IsTrackedFile(const std::filesystem::path& p) const;
        static std::string Key(const std::filesystem::path& p);

        void Remember(const std::filesystem::path& p, VideoMetadata metadata);
        std::optional<VideoMetadata> Metadata(const std::filesystem::path& p) const;
        bool HasMetadata(const std::filesystem::path& p) const;
        size_t MetadataCount() const { return metadata_.size(); }

        // Deletes the file and purges its metadata. Failures are logged, never thrown.
        void Discard(const std::filesystem::path& p);

        std::vector<std::filesystem::path> ListTrackedFiles() const;
        std::uint64_t TrackedBytes() const;

        // Deletes every tracked file not in `keep`. Returns the number removed.
        size_t SweepUntracked(const PathSet& keep);

        // Untracked file with the oldest modification time, if any.
        std::optional<std::filesystem::path> OldestUnprotected(const PathSet& keep) const;

    private:
        std::filesystem::path output_dir_;
        std::string extension_;
        std::unordered_map<std::string, VideoMetadata> metadata_;
    };
}
