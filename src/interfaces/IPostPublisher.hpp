#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace ClipRelay {

class IPostPublisher {
public:
    virtual ~IPostPublisher() = default;
    virtual bool Publish(const std::filesystem::path& file, const std::string& comment, const std::vector<std::string>& hashtags) = 0;
};

}
