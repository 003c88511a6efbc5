#include "pool/WorkingPool.hpp"
#include "concurrency/WaitGroup.hpp"
#include "log/Registry.hpp"

#include <system_error>
#include <thread>

namespace wh::pool {

WorkingPool::WorkingPool(std::string queueNameBase, const unsigned int numWorkers, const std::size_t queueCapacity,
                         const double callsPerSecond, const unsigned int burst)
    : name_(std::move(queueNameBase)),
      queueName_(name_ + ":pending"),
      deadLetterQueueName_(name_ + ":dlq"),
      numWorkers_(numWorkers == 0 ? 1 : numWorkers),
      pending_(queueCapacity),
      limiter_(callsPerSecond, burst) {}

void WorkingPool::registerJob(const std::string& jobType, JobHandler handler) {
    std::unique_lock lock(handlersMutex_);
    handlers_[jobType] = std::move(handler);
    log::Registry::pool()->debug("[WorkingPool] Registered job handler '{}' on {}", jobType, name_);
}

void WorkingPool::submitJob(JobPayload job) {
    pending_.push(std::move(job));
}

bool WorkingPool::submitJob(JobPayload job, concurrency::Context& ctx) {
    return pending_.push(std::move(job), ctx);
}

bool WorkingPool::trySubmitJob(JobPayload job) {
    return pending_.tryPush(std::move(job));
}

std::vector<JobPayload> WorkingPool::deadLetters() const {
    std::scoped_lock lock(dlqMutex_);
    return deadLetters_;
}

void WorkingPool::start(std::shared_ptr<concurrency::Context> ctx,
                        std::shared_ptr<concurrency::WaitGroup> tracker) {
    concurrency::WaitGroup::Guard done(*tracker);

    // a restart waits for the previous run to finish joining its workers
    std::scoped_lock run(runMutex_);
    running_.store(true);

    log::Registry::pool()->info("[WorkingPool] Starting {} with {} worker(s), {} job(s) pending",
                                queueName_, numWorkers_, pending_.size());

    std::vector<std::thread> workers;
    workers.reserve(numWorkers_);
    try {
        for (unsigned int i = 0; i < numWorkers_; ++i)
            workers.emplace_back(&WorkingPool::worker, this, ctx, i + 1);
    } catch (const std::system_error& e) {
        log::Registry::pool()->error("[WorkingPool] Could only spawn {} of {} workers on {}: {}",
                                     workers.size(), numWorkers_, queueName_, e.what());
        ctx->cancel();
    }

    ctx->wait();
    for (auto& t : workers) t.join();

    running_.store(false);
    log::Registry::pool()->info("[WorkingPool] {} stopped, all workers exited", queueName_);
}

void WorkingPool::worker(const std::shared_ptr<concurrency::Context>& ctx, const unsigned int workerId) {
    log::Registry::pool()->debug("[WorkingPool] Worker {} started on {}", workerId, queueName_);

    while (auto job = pending_.pop(*ctx)) {
        if (!limiter_.wait(*ctx)) {
            log::Registry::pool()->debug("[WorkingPool] Worker {}: cancelled waiting for a rate-limit token, requeueing job {}",
                                         workerId, job->job_id);
            requeue(std::move(*job));
            break;
        }

        const bool ok = dispatch(*job, workerId);
        handleResult(std::move(*job), ok, workerId);
    }

    log::Registry::pool()->debug("[WorkingPool] Worker {} on {} shutting down", workerId, queueName_);
}

bool WorkingPool::dispatch(const JobPayload& job, const unsigned int workerId) const {
    JobHandler handler;
    {
        std::shared_lock lock(handlersMutex_);
        const auto it = handlers_.find(job.type);
        if (it == handlers_.end()) {
            log::Registry::pool()->error("[WorkingPool] Worker {}: unknown job type '{}' (job {})",
                                         workerId, job.type, job.job_id);
            return false;
        }
        handler = it->second;
    }

    log::Registry::pool()->debug("[WorkingPool] Worker {}: executing job {} ({}), attempt {}/{}",
                                 workerId, job.job_id, job.type, job.retry_count + 1, job.max_retries + 1);

    try {
        handler(job.params);
    } catch (const std::exception& e) {
        log::Registry::pool()->error("[WorkingPool] Worker {}: job {} ({}) failed: {}",
                                     workerId, job.job_id, job.type, e.what());
        return false;
    } catch (...) {
        log::Registry::pool()->error("[WorkingPool] Worker {}: job {} ({}) failed with an unknown error",
                                     workerId, job.job_id, job.type);
        return false;
    }

    return true;
}

void WorkingPool::handleResult(JobPayload job, const bool ok, const unsigned int workerId) {
    if (ok) {
        ++completed_;
        return;
    }

    ++failed_;

    if (job.retry_count < job.max_retries) {
        ++job.retry_count;
        log::Registry::pool()->info("[WorkingPool] Worker {}: retrying job {} ({}), retry {}/{}",
                                    workerId, job.job_id, job.type, job.retry_count, job.max_retries);
        // never block a worker on its own queue
        requeue(std::move(job));
        return;
    }

    log::Registry::pool()->warn("[WorkingPool] Job {} ({}) exceeded max retries, moving to {}",
                                job.job_id, job.type, deadLetterQueueName_);
    deadLetter(std::move(job));
}

void WorkingPool::requeue(JobPayload job) {
    if (pending_.tryPush(job)) return;
    log::Registry::pool()->error("[WorkingPool] {} is full, cannot requeue job {}", queueName_, job.job_id);
    deadLetter(std::move(job));
}

void WorkingPool::deadLetter(JobPayload job) {
    std::scoped_lock lock(dlqMutex_);
    deadLetters_.push_back(std::move(job));
}

}
