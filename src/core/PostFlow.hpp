#pragma once
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Types.hpp"

namespace ClipRelay {
    enum class PostStage {
        AwaitingComment = 1,
        AwaitingHashtags = 2,
        Submitted = 3
    };

    struct PendingPostFlow {
        PostStage stage = PostStage::AwaitingComment;
        std::filesystem::path artifact;
        std::string comment;
        std::vector<std::string> hashtags;
        std::vector<MessageId> prompt_ids;
        std::chrono::steady_clock::time_point started;
    };

    struct PostTransition {
        enum class Kind {
            Ignored,      // no flow for this requester
            AskHashtags,  // comment stored, ask for hashtags
            Submit        // hashtags stored, flow finished
        };
        Kind kind = Kind::Ignored;
        std::vector<MessageId> stale_prompts; // prompts to delete from the chat
        PendingPostFlow flow;
    };

    // Per-requester two-step prompt flow for posting the current artifact.
    class PostFlowRegistry {
    public:
        using Clock = std::chrono::steady_clock;

        void Begin(RequesterId requester, const std::filesystem::path& artifact, Clock::time_point now = Clock::now());
        void AddPrompt(RequesterId requester, MessageId prompt);
        PostTransition OnText(RequesterId requester, const std::string& text);
        bool Has(RequesterId requester);
        size_t Size();

        // Abandons flows that have been waiting longer than `max_age`.
        size_t ExpireOlderThan(std::chrono::minutes max_age, Clock::time_point now = Clock::now());

        static std::vector<std::string> SplitHashtags(const std::string& text);

    private:
        std::unordered_map<RequesterId, PendingPostFlow> flows_;
        std::mutex mutex_;
    };
}
