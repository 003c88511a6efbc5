#include "pool/Scheduler.hpp"
#include "pool/WorkingPool.hpp"
#include "concurrency/Context.hpp"
#include "concurrency/WaitGroup.hpp"
#include "log/Registry.hpp"
#include "util/duration.hpp"

#include <stdexcept>

namespace wh::pool {

Scheduler::Scheduler(std::string name, const std::chrono::milliseconds interval, std::shared_ptr<WorkingPool> target)
    : name_(std::move(name)), interval_(interval), target_(std::move(target)) {
    if (interval_.count() <= 0) throw std::invalid_argument("[Scheduler] Interval must be positive: " + name_);
    if (!target_) throw std::invalid_argument("[Scheduler] No target pool for scheduler: " + name_);
}

void Scheduler::addJob(JobPayload job) {
    std::scoped_lock lock(mutex_);
    jobs_.push_back(std::move(job));
}

std::vector<JobPayload> Scheduler::jobs() const {
    std::scoped_lock lock(mutex_);
    return jobs_;
}

void Scheduler::start(std::shared_ptr<concurrency::Context> ctx,
                      std::shared_ptr<concurrency::WaitGroup> tracker) {
    concurrency::WaitGroup::Guard done(*tracker);

    log::Registry::scheduler()->info("[Scheduler {}] Running every {} into {}, {} job(s)",
                                     name_, util::formatDuration(interval_), target_->queueName(), jobs().size());

    if (submitJobs(*ctx, true)) {
        auto next = std::chrono::steady_clock::now() + interval_;
        while (!ctx->waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(
                   next - std::chrono::steady_clock::now()))) {
            log::Registry::scheduler()->debug("[Scheduler {}] Tick, submitting jobs", name_);
            if (!submitJobs(*ctx, false)) break;
            ++runCount_;

            // ticks missed while a submission was blocked are dropped, not replayed
            next += interval_;
            if (const auto now = std::chrono::steady_clock::now(); next <= now) {
                log::Registry::scheduler()->debug("[Scheduler {}] Fell behind, skipping missed ticks", name_);
                next = now + interval_;
            }
        }
    }

    log::Registry::scheduler()->info("[Scheduler {}] Shutting down", name_);
}

bool Scheduler::submitJobs(concurrency::Context& ctx, const bool runNowOnly) {
    std::vector<JobPayload> batch;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (runNowOnly && !it->run_now) {
                ++it;
                continue;
            }
            batch.push_back(*it);
            if (it->one_time) it = jobs_.erase(it);
            else ++it;
        }
    }

    for (auto& job : batch) {
        job.job_id = newJobId();
        job.retry_count = 0;

        if (!target_->submitJob(job, ctx)) {
            log::Registry::scheduler()->warn("[Scheduler {}] Shutdown signaled before job {} ({}) was submitted",
                                             name_, job.job_id, job.type);
            return false;
        }

        log::Registry::scheduler()->debug("[Scheduler {}] Submitted job {} ({})", name_, job.job_id, job.type);
    }

    return true;
}

}
