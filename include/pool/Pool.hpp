#pragma once

#include <memory>

namespace wh::concurrency {
class Context;
class WaitGroup;
}

namespace wh::pool {

inline constexpr const char* POOL_TYPE_WORKING = "working";
inline constexpr const char* POOL_TYPE_SCHEDULER = "scheduler";

// A unit of long-running concurrent work the Manager can start and stop by name.
//
// start() runs on a thread of its own and must keep running until ctx is
// cancelled. It must call tracker->done() exactly once on every exit path,
// exceptions included; WaitGroup::Guard does that. A pool that never returns
// after cancellation blocks Manager::shutdown() forever.
class Pool {
public:
    virtual ~Pool() = default;

    virtual void start(std::shared_ptr<concurrency::Context> ctx,
                       std::shared_ptr<concurrency::WaitGroup> tracker) = 0;
};

}
