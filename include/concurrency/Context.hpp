#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace wh::concurrency {

// Cooperative cancellation token. Contexts form a tree: cancelling a parent
// cancels every live descendant, never the other way around.
class Context : public std::enable_shared_from_this<Context> {
public:
    using CancelFunc = std::function<void()>;
    using CallbackId = uint64_t;

    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    static std::shared_ptr<Context> background();

    // Derives a child of parent. The returned CancelFunc cancels only the child
    // and is safe to invoke any number of times from any thread.
    static std::pair<std::shared_ptr<Context>, CancelFunc> withCancel(const std::shared_ptr<Context>& parent);

    void cancel();

    [[nodiscard]] bool isCancelled() const;

    void wait() const;

    // true if the context was cancelled before the timeout elapsed
    bool waitFor(std::chrono::milliseconds timeout) const;

    // Runs cb once when the context is cancelled, on the cancelling thread.
    // If already cancelled, cb runs immediately on the caller's thread.
    CallbackId onCancel(std::function<void()> cb);

    void removeCallback(CallbackId id);

private:
    Context() = default;

    std::shared_ptr<Context> parent_;
    CallbackId parentCallbackId_{0};

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_{false};
    CallbackId nextCallbackId_{1};
    std::map<CallbackId, std::function<void()>> callbacks_;
};

}
