#include "PostFlow.hpp"
#include "../utils/Logger.hpp"
#include <sstream>

namespace ClipRelay {

void PostFlowRegistry::Begin(RequesterId requester, const std::filesystem::path& artifact, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    PendingPostFlow flow;
    flow.artifact = artifact;
    flow.started = now;
    flows_[requester] = std::move(flow);
}

void PostFlowRegistry::AddPrompt(RequesterId requester, MessageId prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = flows_.find(requester);
    if (it != flows_.end()) it->second.prompt_ids.push_back(prompt);
}

PostTransition PostFlowRegistry::OnText(RequesterId requester, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    PostTransition transition;
    auto it = flows_.find(requester);
    if (it == flows_.end()) return transition;

    PendingPostFlow& flow = it->second;
    transition.stale_prompts.swap(flow.prompt_ids);

    switch (flow.stage) {
        case PostStage::AwaitingComment:
            flow.comment = text;
            flow.stage = PostStage::AwaitingHashtags;
            transition.kind = PostTransition::Kind::AskHashtags;
            transition.flow = flow;
            break;
        case PostStage::AwaitingHashtags:
            flow.hashtags = SplitHashtags(text);
            flow.stage = PostStage::Submitted;
            transition.kind = PostTransition::Kind::Submit;
            transition.flow = flow;
            flows_.erase(it);
            break;
        case PostStage::Submitted:
            flows_.erase(it);
            break;
    }
    return transition;
}

bool PostFlowRegistry::Has(RequesterId requester) {
    std::lock_guard<std::mutex> lock(mutex_);
    return flows_.count(requester) > 0;
}

size_t PostFlowRegistry::Size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return flows_.size();
}

size_t PostFlowRegistry::ExpireOlderThan(std::chrono::minutes max_age, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = flows_.begin(); it != flows_.end();) {
        if (now - it->second.started > max_age) {
            Logger::Log(LogLevel::Info, "Abandoning stale post flow for requester " + std::to_string(it->first));
            it = flows_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<std::string> PostFlowRegistry::SplitHashtags(const std::string& text) {
    std::vector<std::string> tags;
    std::istringstream in(text);
    std::string token;
    while (in >> token) tags.push_back(token);
    return tags;
}

}
