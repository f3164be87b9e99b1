#pragma once
#include <string>
#include <vector>

namespace ClipRelay {
    class VideoLinkParser {
    public:
        // href values of every <a> whose target is a single video page, in
        // document order without duplicates. Relative links are kept as-is.
        static std::vector<std::string> Parse(const std::string& html_content);
    };
}
