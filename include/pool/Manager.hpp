#pragma once

#include "concurrency/BoundedQueue.hpp"
#include "concurrency/Context.hpp"
#include "concurrency/WaitGroup.hpp"
#include "pool/Command.hpp"
#include "pool/Pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wh::pool {

struct PoolInfo {
    std::string name;
    std::string type;
    std::chrono::system_clock::time_point startedAt;
};

// Starts, tracks and stops named pools. All registry mutations happen on the
// thread that calls run(); startPool()/stopPool() only enqueue commands for it.
//
// Lifecycle: construct, run() on a dedicated thread, submit commands from
// anywhere, then shutdown() once and join the run() thread before destroying.
class Manager {
public:
    enum class State { Created, Running, ShuttingDown, Stopped };

    static constexpr std::size_t DEFAULT_COMMAND_QUEUE_CAPACITY = 10;

    explicit Manager(std::size_t commandQueueCapacity = DEFAULT_COMMAND_QUEUE_CAPACITY);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Control loop. Blocks until shutdown is observed; throws std::logic_error
    // when invoked a second time.
    void run();

    // Enqueue a command, blocking while the command queue is full.
    // Throw concurrency::QueueClosed after shutdown() has completed.
    void startPool(const std::string& name, std::shared_ptr<Pool> pool,
                   const std::string& poolType = POOL_TYPE_WORKING);
    void stopPool(const std::string& name);

    // Non-blocking variants; false when the command queue is full or closed.
    bool tryStartPool(const std::string& name, std::shared_ptr<Pool> pool,
                      const std::string& poolType = POOL_TYPE_WORKING);
    bool tryStopPool(const std::string& name);

    [[nodiscard]] std::pair<std::shared_ptr<Pool>, bool> getPool(const std::string& name) const;

    [[nodiscard]] std::vector<PoolInfo> listPools() const;

    // Root context; every pool context derives from it.
    [[nodiscard]] std::shared_ptr<concurrency::Context> context() const { return context_; }

    [[nodiscard]] State state() const;

    // Cancels every pool and waits for all of them to return. A pool that
    // ignores cancellation makes this block forever; use shutdownFor() to
    // bound the wait. Only the first call has any effect.
    void shutdown();

    // false if pools were still running when the timeout elapsed; they are
    // abandoned, not killed.
    bool shutdownFor(std::chrono::milliseconds timeout);

private:
    struct Entry {
        std::shared_ptr<Pool> pool;
        std::string type;
        concurrency::Context::CancelFunc cancel;
        std::chrono::system_clock::time_point startedAt;
    };

    void handle(StartCommand& cmd);
    void handle(const StopCommand& cmd);
    void spawn(const std::string& name, const std::shared_ptr<Pool>& pool,
               std::shared_ptr<concurrency::Context> ctx);
    void cancelAll();

    void setState(State state);
    bool beginShutdown();
    void finishShutdown();

    std::shared_ptr<concurrency::Context> context_;
    concurrency::Context::CancelFunc cancel_;
    std::shared_ptr<concurrency::WaitGroup> tracker_;
    concurrency::BoundedQueue<Command> commands_;

    mutable std::shared_mutex registryMutex_;
    std::unordered_map<std::string, Entry> registry_;

    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    State state_{State::Created};

    std::atomic<bool> runInvoked_{false};
    std::atomic<bool> shutdownRequested_{false};
};

const char* to_string(Manager::State state);

}
