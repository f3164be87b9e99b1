#include "CaptionBuilder.hpp"
#include <vector>

namespace ClipRelay {

std::string BuildCaption(const std::string& intro, const std::optional<VideoMetadata>& metadata) {
    std::vector<std::string> parts;
    if (!intro.empty()) parts.push_back(intro);
    if (metadata && !metadata->caption.empty()) parts.push_back("Original Caption: " + metadata->caption);
    if (metadata && !metadata->hashtags.empty()) {
        std::string tags;
        for (const auto& t : metadata->hashtags) {
            if (!tags.empty()) tags += ' ';
            tags += t;
        }
        parts.push_back("Hashtags: " + tags);
    }

    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += "\n\n";
        out += p;
    }
    return out;
}

std::string ClipText(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    static const std::string kEllipsis = "...";
    if (max_bytes < kEllipsis.size()) return std::string();

    size_t cut = max_bytes - kEllipsis.size();
    // Back off continuation bytes (10xxxxxx) to a code-point start.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + kEllipsis;
}

ActionSet ActionsFor(int nav_index) {
    ActionSet actions;
    actions.previous = nav_index > 0;
    actions.post = true;
    actions.next = true;
    return actions;
}

}
