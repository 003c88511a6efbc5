#include "concurrency/RateLimiter.hpp"
#include "concurrency/Context.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

using namespace wh::concurrency;

RateLimiter::RateLimiter(const double callsPerSecond, const unsigned int burst)
    : rate_(callsPerSecond),
      burst_(burst == 0 ? 1 : burst),
      tokens_(burst_),
      last_(std::chrono::steady_clock::now()) {}

void RateLimiter::refill(const std::chrono::steady_clock::time_point now) {
    const std::chrono::duration<double> elapsed = now - last_;
    tokens_ = std::min<double>(burst_, tokens_ + elapsed.count() * rate_);
    last_ = now;
}

bool RateLimiter::tryAcquire() {
    if (unlimited()) return true;

    std::scoped_lock lock(mutex_);
    refill(std::chrono::steady_clock::now());
    if (tokens_ < 1.0) return false;
    tokens_ -= 1.0;
    return true;
}

bool RateLimiter::wait(Context& ctx) {
    if (ctx.isCancelled()) return false;
    if (unlimited()) return true;

    std::chrono::milliseconds delay;
    {
        std::scoped_lock lock(mutex_);
        refill(std::chrono::steady_clock::now());

        // reserve the token now; a negative balance is the time still owed
        tokens_ -= 1.0;
        if (tokens_ >= 0.0) return true;
        delay = std::chrono::milliseconds(static_cast<int64_t>(std::ceil(-tokens_ / rate_ * 1000.0)));
    }

    if (!ctx.waitFor(delay)) return true;

    std::scoped_lock lock(mutex_);
    tokens_ = std::min<double>(burst_, tokens_ + 1.0);
    return false;
}
