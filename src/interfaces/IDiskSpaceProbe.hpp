#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>

namespace ClipRelay {

class IDiskSpaceProbe {
public:
    virtual ~IDiskSpaceProbe() = default;
    // Bytes available to this process on the volume holding `dir`; nullopt if unknown.
    virtual std::optional<std::uint64_t> FreeBytes(const std::filesystem::path& dir) = 0;
};

}
