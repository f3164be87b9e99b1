#pragma once
#include <dpp/dpp.h>
#include <optional>
#include "../interfaces/INotificationChannel.hpp"

namespace ClipRelay {
    // Presents artifacts in a Discord channel as a video attachment with
    // navigation buttons. Every send waits for Discord's confirmation, bounded
    // by `timeout_ms`.
    class DiscordChannel : public INotificationChannel {
    public:
        DiscordChannel(dpp::cluster& bot, int timeout_ms);

        bool PresentArtifact(const Presentation& presentation) override;
        std::optional<MessageId> SendText(RequesterId target, const std::string& text, bool with_next_action) override;
        void DeleteMessage(RequesterId target, MessageId message) override;

        static dpp::component BuildActionRow(const ActionSet& actions);

    private:
        std::optional<dpp::message> CreateAndWait(const dpp::message& msg);

        dpp::cluster& bot;
        int timeout_ms_;
    };
}
