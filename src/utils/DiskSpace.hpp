#pragma once
#include "../interfaces/IDiskSpaceProbe.hpp"

namespace ClipRelay {
    class FilesystemSpaceProbe : public IDiskSpaceProbe {
    public:
        std::optional<std::uint64_t> FreeBytes(const std::filesystem::path& dir) override;
    };
}
