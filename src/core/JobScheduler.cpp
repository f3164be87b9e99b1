#include "JobScheduler.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>

namespace ClipRelay {

JobScheduler::JobScheduler(ThreadPool& pool) : thread_pool(pool), stop_(false) {
    scheduler_thread = std::thread(&JobScheduler::Run, this);
}

JobScheduler::~JobScheduler() {
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        stop_ = true;
    }
    cv.notify_all();
    if (scheduler_thread.joinable()) {
        scheduler_thread.join();
    }
}

void JobScheduler::Run() {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    while (!stop_) {
        if (jobs.empty()) {
            cv.wait(lock, [this] { return stop_ || !jobs.empty(); });
            if (stop_) break;
        } else {
            // Sort to select the job with the earliest execution time
            std::sort(jobs.begin(), jobs.end(), [](const ScheduledJob& a, const ScheduledJob& b) {
                return a.execution_time > b.execution_time; // back() will be the earliest job
            });

            auto now = std::chrono::steady_clock::now();
            ScheduledJob& next_job = jobs.back();

            if (next_job.execution_time <= now) {
                ScheduledJob job_to_run = std::move(next_job);
                jobs.pop_back();
                // Unlock before executing so other threads can Cancel/Schedule
                lock.unlock();
                if (!job_to_run.cancelled) {
                    try {
                        thread_pool.enqueue(job_to_run.job);
                    } catch (const std::exception& e) {
                        Logger::Log(LogLevel::Warn, "Dropping job " + job_to_run.id + ": " + e.what());
                    }
                }
                lock.lock();
            } else {
                // Wait for the stop signal, a new job, or the specified time
                auto wake_at = next_job.execution_time;
                unsigned long seen = generation_;
                cv.wait_until(lock, wake_at, [this, seen]{ return stop_ || generation_ != seen; });
            }
        }
    }
}

void JobScheduler::Schedule(const JobId& id, std::chrono::milliseconds delay, Job job) {
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        if (!accepting_) {
            Logger::Log(LogLevel::Debug, "Scheduler stopped, ignoring job: " + id);
            return;
        }

        // Check if a job with this ID already exists.
        auto it = std::find_if(jobs.begin(), jobs.end(), [&id](const ScheduledJob& j) {
            return j.id == id;
        });

        if (it != jobs.end()) {
            // If it exists, update it.
            it->execution_time = std::chrono::steady_clock::now() + delay;
            it->job = std::move(job);
            it->cancelled = false; // In case it was cancelled before
            Logger::Log(LogLevel::Debug, "Updating existing job: " + id);
        } else {
            jobs.push_back({
                id,
                std::chrono::steady_clock::now() + delay,
                std::move(job),
                false
            });
        }
        ++generation_;
    }
    cv.notify_one();
}

void JobScheduler::Cancel(const JobId& id) {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    bool any = false;
    for (auto& job : jobs) {
        if (job.id == id) {
            job.cancelled = true;
            any = true;
        }
    }
    if (any) {
        Logger::Log(LogLevel::Info, "Cancelled job(s): " + id);
    }
    cv.notify_all();
}

void JobScheduler::Stop() {
    {
        std::unique_lock<std::mutex> lock(jobs_mutex);
        accepting_ = false;
        jobs.clear();
        ++generation_;
    }
    cv.notify_all();
}

size_t JobScheduler::Pending() {
    std::unique_lock<std::mutex> lock(jobs_mutex);
    return static_cast<size_t>(std::count_if(jobs.begin(), jobs.end(), [](const ScheduledJob& j) { return !j.cancelled; }));
}

}
