#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "../core/Types.hpp"

namespace ClipRelay {

struct ActionSet {
    bool previous = false;
    bool post = true;
    bool next = true;
};

struct Presentation {
    RequesterId target = 0;
    std::filesystem::path file;
    int nav_index = 0;
    std::string caption;
    ActionSet actions;
};

class INotificationChannel {
public:
    virtual ~INotificationChannel() = default;
    virtual bool PresentArtifact(const Presentation& presentation) = 0;
    // Sends a prompt or notice; returns its id so it can be deleted later.
    virtual std::optional<MessageId> SendText(RequesterId target, const std::string& text, bool with_next_action) = 0;
    virtual void DeleteMessage(RequesterId target, MessageId message) = 0;
};

}
