#pragma once

#include "concurrency/BoundedQueue.hpp"
#include "concurrency/RateLimiter.hpp"
#include "pool/Job.hpp"
#include "pool/Pool.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wh::pool {

// Fixed number of worker threads draining a bounded queue of jobs, dispatched
// by job type. Failed jobs are retried up to max_retries, then dead-lettered.
// Pending jobs survive a stop/start cycle of the same WorkingPool. Workers take
// a token from the pool's rate limiter before each dispatch.
class WorkingPool final : public Pool {
public:
    static constexpr std::size_t DEFAULT_QUEUE_CAPACITY = 1024;

    // callsPerSecond <= 0 leaves dispatch unthrottled
    WorkingPool(std::string queueNameBase, unsigned int numWorkers,
                std::size_t queueCapacity = DEFAULT_QUEUE_CAPACITY,
                double callsPerSecond = 0.0, unsigned int burst = 1);

    void registerJob(const std::string& jobType, JobHandler handler);

    void submitJob(JobPayload job);
    bool submitJob(JobPayload job, concurrency::Context& ctx);
    bool trySubmitJob(JobPayload job);

    void start(std::shared_ptr<concurrency::Context> ctx,
               std::shared_ptr<concurrency::WaitGroup> tracker) override;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& queueName() const { return queueName_; }
    [[nodiscard]] const std::string& deadLetterQueueName() const { return deadLetterQueueName_; }
    [[nodiscard]] unsigned int numWorkers() const { return numWorkers_; }
    [[nodiscard]] const concurrency::RateLimiter& limiter() const { return limiter_; }

    [[nodiscard]] std::size_t pendingCount() const { return pending_.size(); }
    [[nodiscard]] std::vector<JobPayload> deadLetters() const;
    [[nodiscard]] uint64_t completedCount() const { return completed_.load(); }
    [[nodiscard]] uint64_t failedCount() const { return failed_.load(); }
    [[nodiscard]] bool isRunning() const { return running_.load(); }

private:
    void worker(const std::shared_ptr<concurrency::Context>& ctx, unsigned int workerId);
    bool dispatch(const JobPayload& job, unsigned int workerId) const;
    void handleResult(JobPayload job, bool ok, unsigned int workerId);
    void requeue(JobPayload job);
    void deadLetter(JobPayload job);

    std::string name_, queueName_, deadLetterQueueName_;
    unsigned int numWorkers_;
    concurrency::BoundedQueue<JobPayload> pending_;
    concurrency::RateLimiter limiter_;

    mutable std::shared_mutex handlersMutex_;
    std::unordered_map<std::string, JobHandler> handlers_;

    mutable std::mutex dlqMutex_;
    std::vector<JobPayload> deadLetters_;

    std::mutex runMutex_;
    std::atomic<uint64_t> completed_{0}, failed_{0};
    std::atomic<bool> running_{false};
};

}
