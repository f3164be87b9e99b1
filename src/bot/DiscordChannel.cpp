#include "DiscordChannel.hpp"
#include "../core/NavigationHandler.hpp"
#include "../utils/CaptionBuilder.hpp"
#include "../utils/Logger.hpp"
#include <future>
#include <memory>

namespace ClipRelay {

namespace {
// Discord rejects message content above this length.
constexpr size_t kMaxContentLength = 2000;

std::string Clip(const std::string& text) {
    return ClipText(text, kMaxContentLength);
}

dpp::component Button(const std::string& label, Signal signal, dpp::component_style style) {
    return dpp::component()
        .set_type(dpp::cot_button)
        .set_label(label)
        .set_style(style)
        .set_id(SignalId(signal));
}
}

DiscordChannel::DiscordChannel(dpp::cluster& bot, int timeout_ms) : bot(bot), timeout_ms_(timeout_ms) {}

dpp::component DiscordChannel::BuildActionRow(const ActionSet& actions) {
    dpp::component row;
    row.set_type(dpp::cot_action_row);
    if (actions.previous) row.add_component(Button("\xE2\x97\x80\xEF\xB8\x8F Previous", Signal::Previous, dpp::cos_secondary));
    if (actions.post)     row.add_component(Button("Post \xE2\xAC\x86\xEF\xB8\x8F", Signal::Post, dpp::cos_success));
    if (actions.next)     row.add_component(Button("Next \xE2\x96\xB6\xEF\xB8\x8F", Signal::Next, dpp::cos_primary));
    return row;
}

std::optional<dpp::message> DiscordChannel::CreateAndWait(const dpp::message& msg) {
    auto pp = std::make_shared<std::promise<std::optional<dpp::message>>>();
    auto fut = pp->get_future();
    bot.message_create(msg, [pp](const dpp::confirmation_callback_t& cc) {
        if (cc.is_error()) {
            Logger::Log(LogLevel::Warn, "Discord rejected message: " + cc.get_error().message);
            pp->set_value(std::nullopt);
            return;
        }
        try {
            pp->set_value(std::get<dpp::message>(cc.value));
        } catch (const std::bad_variant_access&) {
            pp->set_value(std::nullopt);
        }
    });
    if (fut.wait_for(std::chrono::milliseconds(timeout_ms_)) != std::future_status::ready) {
        Logger::Log(LogLevel::Warn, "Timed out waiting for Discord to confirm a message");
        return std::nullopt;
    }
    return fut.get();
}

bool DiscordChannel::PresentArtifact(const Presentation& p) {
    dpp::message msg(dpp::snowflake(p.target), Clip(p.caption));
    try {
        msg.add_file(p.file.filename().string(), dpp::utility::read_file(p.file.string()));
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Cannot read " + p.file.string() + ": " + e.what());
        return false;
    }
    msg.add_component(BuildActionRow(p.actions));
    return CreateAndWait(msg).has_value();
}

std::optional<MessageId> DiscordChannel::SendText(RequesterId target, const std::string& text, bool with_next_action) {
    dpp::message msg(dpp::snowflake(target), Clip(text));
    if (with_next_action) {
        ActionSet next_only;
        next_only.post = false;
        next_only.next = false;
        dpp::component row = BuildActionRow(next_only);
        row.add_component(Button("Next \xE2\x96\xB6\xEF\xB8\x8F", Signal::PostNext, dpp::cos_primary));
        msg.add_component(row);
    }
    auto sent = CreateAndWait(msg);
    if (!sent) return std::nullopt;
    return static_cast<MessageId>(sent->id);
}

void DiscordChannel::DeleteMessage(RequesterId target, MessageId message) {
    bot.message_delete(dpp::snowflake(message), dpp::snowflake(target), [message](const dpp::confirmation_callback_t& cc) {
        if (cc.is_error()) {
            Logger::Log(LogLevel::Warn, "Failed to delete message " + std::to_string(message) + ": " + cc.get_error().message);
        }
    });
}

}
