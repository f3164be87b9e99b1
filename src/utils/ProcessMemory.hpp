#pragma once
#include <functional>
#include <optional>
#include <string>
#include "../interfaces/IMemoryProbe.hpp"

namespace ClipRelay {
    // Samples VmRSS from /proc/<pid>/status. The pid comes from `pid_source`;
    // when it has none, the current process is sampled instead.
    class ProcessMemoryProbe : public IMemoryProbe {
    public:
        using PidSource = std::function<std::optional<int>()>;

        explicit ProcessMemoryProbe(PidSource pid_source = {});
        std::optional<long> ResidentMegabytes() override;

        // Parses the VmRSS line of a /proc status file into whole megabytes.
        static std::optional<long> ParseVmRssMegabytes(const std::string& status_text);

    private:
        PidSource pid_source_;
    };
}
