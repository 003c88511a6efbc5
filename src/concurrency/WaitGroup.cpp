#include "concurrency/WaitGroup.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace wh::concurrency;

void WaitGroup::add(const int64_t delta) {
    {
        std::scoped_lock lock(mutex_);
        if (count_ + delta < 0) throw std::logic_error("[WaitGroup] Negative counter");
        count_ += delta;
        if (count_ != 0) return;
    }
    cv_.notify_all();
}

void WaitGroup::done() {
    add(-1);
}

void WaitGroup::wait() const {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return count_ == 0; });
}

bool WaitGroup::waitFor(const std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return count_ == 0; });
}

int64_t WaitGroup::count() const {
    std::scoped_lock lock(mutex_);
    return count_;
}

WaitGroup::Guard::~Guard() {
    try {
        wg_.done();
    } catch (const std::logic_error& e) {
        if (log::Registry::isInitialized())
            log::Registry::workhall()->error("[WaitGroup] Guard released an already drained counter: {}", e.what());
    }
}
