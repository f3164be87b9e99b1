#pragma once
#include <optional>

namespace ClipRelay {

class IMemoryProbe {
public:
    virtual ~IMemoryProbe() = default;
    // Resident memory of the automation process in MB; nullopt when sampling is unavailable.
    virtual std::optional<long> ResidentMegabytes() = 0;
};

}
