#include "DiskSpace.hpp"
#include "Logger.hpp"
#include <system_error>

namespace ClipRelay {

std::optional<std::uint64_t> FilesystemSpaceProbe::FreeBytes(const std::filesystem::path& dir) {
    std::error_code ec;
    auto info = std::filesystem::space(dir, ec);
    if (ec) {
        Logger::Log(LogLevel::Warn, "Cannot query free space of " + dir.string() + ": " + ec.message());
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.available);
}

}
