#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace wh::concurrency {

// Counting completion tracker. add() before handing work off, done() exactly
// once when that work finishes, wait() until the count drops to zero.
class WaitGroup {
public:
    WaitGroup() = default;

    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    void add(int64_t delta = 1);

    void done();

    void wait() const;

    // true if the count reached zero before the timeout elapsed
    bool waitFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] int64_t count() const;

    // Calls done() when it goes out of scope, on every exit path. A counter
    // that is already zero (done() called by hand as well) is logged, not thrown.
    class Guard {
    public:
        explicit Guard(WaitGroup& wg) : wg_(wg) {}
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        WaitGroup& wg_;
    };

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    int64_t count_{0};
};

}
