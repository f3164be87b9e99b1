#pragma once
#include <optional>
#include <string>
#include "../core/Types.hpp"
#include "../interfaces/INotificationChannel.hpp"

namespace ClipRelay {

// Intro, original caption and hashtags, separated by blank lines.
std::string BuildCaption(const std::string& intro, const std::optional<VideoMetadata>& metadata);

// Cuts `text` to at most `max_bytes`, ending in "..." when shortened. Never
// splits a UTF-8 sequence.
std::string ClipText(const std::string& text, size_t max_bytes);

// "Previous" is offered only when there is an older entry to go back to.
ActionSet ActionsFor(int nav_index);

}
