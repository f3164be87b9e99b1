#pragma once
#include <functional>
#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <chrono>
#include "../utils/ThreadPool.hpp"

namespace ClipRelay {
    class JobScheduler {
    public:
        using Job = std::function<void()>;
        using JobId = std::string;

        JobScheduler(ThreadPool& pool);
        ~JobScheduler();

        // Replaces any pending job with the same id.
        void Schedule(const JobId& id, std::chrono::milliseconds delay, Job job);
        void Cancel(const JobId& id);
        // Drops every pending job and refuses new ones.
        void Stop();
        size_t Pending();

    private:
        void Run();

        struct ScheduledJob {
            JobId id;
            std::chrono::steady_clock::time_point execution_time;
            Job job;
            bool cancelled = false;
        };

        ThreadPool& thread_pool;
        std::vector<ScheduledJob> jobs;
        std::mutex jobs_mutex;
        std::condition_variable cv;
        std::thread scheduler_thread;
        unsigned long generation_ = 0;
        bool accepting_ = true;
        bool stop_ = false;
    };
}
