#pragma once
#include <functional>
#include <optional>
#include <string>
#include "../core/Errors.hpp"
#include "../core/Types.hpp"

namespace ClipRelay {

struct DiscoveryResult {
    std::optional<ContentRef> ref;
    ErrorKind kind = ErrorKind::None;
    std::string error;
};

class IContentDiscoverer {
public:
    using SeenPredicate = std::function<bool(const ContentRef&)>;
    virtual ~IContentDiscoverer() = default;
    // Returns one identifier for which `is_seen` is false, retrying internally.
    virtual DiscoveryResult DiscoverOne(const SeenPredicate& is_seen) = 0;
};

}
