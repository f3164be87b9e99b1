#include "NavigationHandler.hpp"
#include "../utils/CaptionBuilder.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <thread>

namespace ClipRelay {

std::optional<Signal> ParseSignal(const std::string& id) {
    if (id == "next_video") return Signal::Next;
    if (id == "prev_video") return Signal::Previous;
    if (id == "post_video") return Signal::Post;
    if (id == "post_next") return Signal::PostNext;
    return std::nullopt;
}

const char* SignalId(Signal signal) {
    switch (signal) {
        case Signal::Next:     return "next_video";
        case Signal::Previous: return "prev_video";
        case Signal::Post:     return "post_video";
        case Signal::PostNext: return "post_next";
    }
    return "";
}

NavigationHandler::NavigationHandler(PipelineOrchestrator& orchestrator, INotificationChannel& channel,
                                     PostFlowRegistry& flows, IPostPublisher& publisher, ThreadPool& pool, Options options)
    : orchestrator_(orchestrator), channel_(channel), flows_(flows), publisher_(publisher),
      thread_pool_(pool), options_(options) {}

void NavigationHandler::OnSignal(RequesterId requester, Signal signal) {
    auto start = std::chrono::steady_clock::now();

    switch (signal) {
        case Signal::Next:
        case Signal::PostNext: {
            NavigationResult res = orchestrator_.Next();
            if (res.Ok()) {
                Present(requester, res, "");
            } else {
                channel_.SendText(requester, res.message, false);
            }
            break;
        }
        case Signal::Previous: {
            NavigationResult res = orchestrator_.Previous();
            if (res.Ok()) {
                Present(requester, res, "");
            } else {
                channel_.SendText(requester, res.message, false);
            }
            break;
        }
        case Signal::Post:
            BeginPost(requester);
            break;
    }

    double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    Logger::Log(LogLevel::Debug, std::string("Signal ") + SignalId(signal) + " handled in " + std::to_string(secs) + " seconds");
}

bool NavigationHandler::PresentCurrent(RequesterId requester, const std::string& intro) {
    NavigationResult res = orchestrator_.Current();
    if (!res.Ok()) {
        Logger::Log(LogLevel::Error, "No current video to present");
        return false;
    }
    return Present(requester, res, intro);
}

bool NavigationHandler::Present(RequesterId requester, const NavigationResult& res, const std::string& intro) {
    if (!res.artifact) return false;
    const Artifact& artifact = *res.artifact;

    std::error_code ec;
    if (!std::filesystem::exists(artifact.path, ec)) {
        Logger::Log(LogLevel::Error, "Video file " + artifact.path.string() + " does not exist");
        return false;
    }

    Presentation p;
    p.target = requester;
    p.file = artifact.path;
    p.nav_index = res.index;
    p.caption = BuildCaption(intro, orchestrator_.ResolveMetadata(artifact));
    p.actions = ActionsFor(res.index);

    const int attempts = std::max(1, options_.present_retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (channel_.PresentArtifact(p)) {
            Logger::Log(LogLevel::Info, "Sent video " + artifact.path.string());
            return true;
        }
        Logger::Log(LogLevel::Error, "Failed to send video " + artifact.path.string() + " (attempt " + std::to_string(attempt) + ")");
        if (attempt < attempts) std::this_thread::sleep_for(options_.retry_pause);
    }
    Logger::Log(LogLevel::Error, "Failed to send video " + artifact.path.string() + " after " + std::to_string(attempts) + " attempts");
    return false;
}

void NavigationHandler::BeginPost(RequesterId requester) {
    NavigationResult res = orchestrator_.Current();
    if (!res.Ok() || !res.artifact) {
        Logger::Log(LogLevel::Warn, "No current video to post");
        return;
    }
    flows_.Begin(requester, res.artifact->path);
    if (auto prompt = channel_.SendText(requester, "What would you like to comment?", false)) {
        flows_.AddPrompt(requester, *prompt);
    }
}

void NavigationHandler::OnText(RequesterId requester, const std::string& text) {
    PostTransition t = flows_.OnText(requester, text);
    if (t.kind == PostTransition::Kind::Ignored) return;

    DeletePrompts(requester, t.stale_prompts);
    if (t.kind == PostTransition::Kind::AskHashtags) {
        if (auto prompt = channel_.SendText(requester, "What would you like as your #?", false)) {
            flows_.AddPrompt(requester, *prompt);
        }
        return;
    }
    SubmitPost(requester, t.flow);
}

void NavigationHandler::SubmitPost(RequesterId requester, const PendingPostFlow& flow) {
    channel_.SendText(requester, "Your post is now processing. Please check your account shortly to confirm.", true);

    auto file = flow.artifact;
    auto comment = flow.comment;
    auto hashtags = flow.hashtags;
    try {
        thread_pool_.enqueue([this, file, comment, hashtags]() {
            try {
                if (publisher_.Publish(file, comment, hashtags)) {
                    Logger::Log(LogLevel::Info, "Background post succeeded for " + file.string());
                } else {
                    Logger::Log(LogLevel::Warn, "Background post failed for " + file.string());
                }
            } catch (const std::exception& e) {
                Logger::Log(LogLevel::Error, "Background post raised: " + std::string(e.what()));
            }
        });
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Could not queue post for " + file.string() + ": " + e.what());
    }
}

void NavigationHandler::DeletePrompts(RequesterId requester, const std::vector<MessageId>& prompts) {
    for (MessageId id : prompts) {
        channel_.DeleteMessage(requester, id);
    }
}

}
