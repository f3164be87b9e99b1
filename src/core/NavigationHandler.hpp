#pragma once
#include <chrono>
#include <optional>
#include <string>
#include "PipelineOrchestrator.hpp"
#include "PostFlow.hpp"
#include "../interfaces/INotificationChannel.hpp"
#include "../interfaces/IPostPublisher.hpp"
#include "../utils/ThreadPool.hpp"

namespace ClipRelay {
    enum class Signal {
        Next,
        Previous,
        Post,
        PostNext
    };

    // Maps a button id ("next_video", "prev_video", "post_video", "post_next").
    std::optional<Signal> ParseSignal(const std::string& id);
    const char* SignalId(Signal signal);

    // Reacts to the chat's inbound signals and text replies.
    class NavigationHandler {
    public:
        struct Options {
            int present_retries = 3;
            std::chrono::milliseconds retry_pause{1000};
        };

        NavigationHandler(PipelineOrchestrator& orchestrator, INotificationChannel& channel,
                          PostFlowRegistry& flows, IPostPublisher& publisher, ThreadPool& pool, Options options);

        void OnSignal(RequesterId requester, Signal signal);
        void OnText(RequesterId requester, const std::string& text);
        bool PresentCurrent(RequesterId requester, const std::string& intro = "");

    private:
        bool Present(RequesterId requester, const NavigationResult& res, const std::string& intro);
        void BeginPost(RequesterId requester);
        void SubmitPost(RequesterId requester, const PendingPostFlow& flow);
        void DeletePrompts(RequesterId requester, const std::vector<MessageId>& prompts);

        PipelineOrchestrator& orchestrator_;
        INotificationChannel& channel_;
        PostFlowRegistry& flows_;
        IPostPublisher& publisher_;
        ThreadPool& thread_pool_;
        Options options_;
    };
}
