#pragma once

#include <chrono>
#include <mutex>

namespace wh::concurrency {

class Context;

// Token bucket shared by the workers of one pool. Refills at callsPerSecond up
// to burst tokens and starts full. A non-positive rate disables limiting.
class RateLimiter {
public:
    RateLimiter(double callsPerSecond, unsigned int burst);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks until a token is available; false if ctx was cancelled first, in
    // which case the token is handed back.
    bool wait(Context& ctx);

    bool tryAcquire();

    [[nodiscard]] bool unlimited() const { return rate_ <= 0.0; }
    [[nodiscard]] double rate() const { return rate_; }
    [[nodiscard]] unsigned int burst() const { return burst_; }

private:
    void refill(std::chrono::steady_clock::time_point now);

    const double rate_;
    const unsigned int burst_;

    std::mutex mutex_;
    double tokens_;
    std::chrono::steady_clock::time_point last_;
};

}
