#include "RuntimeRecycler.hpp"
#include "Errors.hpp"
#include "../utils/Logger.hpp"
#include <thread>

namespace ClipRelay {

RuntimeRecycler::RuntimeRecycler(IRuntimeSession& session, IMemoryProbe& probe, RecyclePolicy policy)
    : session_(session), probe_(probe), policy_(policy) {}

void RuntimeRecycler::Launch() {
    try {
        session_.Start();
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        throw PipelineError(ErrorKind::Fatal, std::string("Cannot start browser session: ") + e.what());
    }
    session_.ApplyStoredCredentials();
    preload_counter_ = 0;
}

void RuntimeRecycler::Teardown() {
    try {
        session_.Stop();
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Failed to close browser session: " + std::string(e.what()));
    }
}

RecycleReason RuntimeRecycler::Evaluate() {
    int count = preload_counter_.load();
    if (policy_.restart_preload_threshold > 0 && count >= policy_.restart_preload_threshold) {
        Logger::Log(LogLevel::Info, "Recycling browser after " + std::to_string(count) + " preloads");
        return RecycleReason::PreloadThreshold;
    }

    if (policy_.memory_soft_limit_mb > 0) {
        auto rss = probe_.ResidentMegabytes();
        if (rss && *rss >= policy_.memory_soft_limit_mb) {
            Logger::Log(LogLevel::Info, "Recycling browser due to RSS " + std::to_string(*rss) + " MB >= " + std::to_string(policy_.memory_soft_limit_mb) + " MB");
            return RecycleReason::MemoryLimit;
        }
    }
    return RecycleReason::None;
}

bool RuntimeRecycler::RecycleIfNeeded() {
    if (Evaluate() == RecycleReason::None) return false;

    Teardown();
    if (policy_.settle_delay.count() > 0) {
        std::this_thread::sleep_for(policy_.settle_delay);
    }
    try {
        Launch();
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Browser recycle failed: " + std::string(e.what()));
        return false;
    }
    return true;
}

}
