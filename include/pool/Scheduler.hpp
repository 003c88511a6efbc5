#pragma once

#include "pool/Job.hpp"
#include "pool/Pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wh::concurrency { class Context; }

namespace wh::pool {

class WorkingPool;

// Periodically submits a fixed list of jobs to a WorkingPool. Runs under the
// Manager like any other pool, registered with POOL_TYPE_SCHEDULER.
class Scheduler final : public Pool {
public:
    Scheduler(std::string name, std::chrono::milliseconds interval, std::shared_ptr<WorkingPool> target);

    void addJob(JobPayload job);

    void start(std::shared_ptr<concurrency::Context> ctx,
               std::shared_ptr<concurrency::WaitGroup> tracker) override;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }
    [[nodiscard]] std::vector<JobPayload> jobs() const;
    [[nodiscard]] uint64_t runCount() const { return runCount_.load(); }

private:
    // false if ctx was cancelled mid-batch
    bool submitJobs(concurrency::Context& ctx, bool runNowOnly);

    std::string name_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<WorkingPool> target_;

    mutable std::mutex mutex_;
    std::vector<JobPayload> jobs_;

    std::atomic<uint64_t> runCount_{0};
};

}
