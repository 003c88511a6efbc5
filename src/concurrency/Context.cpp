#include "concurrency/Context.hpp"
#include "log/Registry.hpp"

#include <exception>

using namespace wh::concurrency;

Context::~Context() {
    if (parent_) parent_->removeCallback(parentCallbackId_);
}

std::shared_ptr<Context> Context::background() {
    return std::shared_ptr<Context>(new Context());
}

std::pair<std::shared_ptr<Context>, Context::CancelFunc> Context::withCancel(const std::shared_ptr<Context>& parent) {
    std::shared_ptr<Context> child(new Context());
    const std::weak_ptr<Context> weak = child;

    if (parent) {
        child->parent_ = parent;
        child->parentCallbackId_ = parent->onCancel([weak] {
            if (const auto ctx = weak.lock()) ctx->cancel();
        });
    }

    return {child, [weak] {
        if (const auto ctx = weak.lock()) ctx->cancel();
    }};
}

void Context::cancel() {
    std::map<CallbackId, std::function<void()>> callbacks;
    {
        std::scoped_lock lock(mutex_);
        if (cancelled_) return;
        cancelled_ = true;
        callbacks.swap(callbacks_);
    }

    cv_.notify_all();

    // outside the lock: callbacks may cancel children or remove themselves.
    // One failing callback must not keep the rest of the tree from being cancelled.
    for (auto& [id, cb] : callbacks) {
        if (!cb) continue;
        try {
            cb();
        } catch (const std::exception& e) {
            if (log::Registry::isInitialized())
                log::Registry::workhall()->error("[Context] Cancel callback {} threw: {}", id, e.what());
        } catch (...) {
            if (log::Registry::isInitialized())
                log::Registry::workhall()->error("[Context] Cancel callback {} threw an unknown error", id);
        }
    }
}

bool Context::isCancelled() const {
    std::scoped_lock lock(mutex_);
    return cancelled_;
}

void Context::wait() const {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_; });
}

bool Context::waitFor(const std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
}

Context::CallbackId Context::onCancel(std::function<void()> cb) {
    {
        std::scoped_lock lock(mutex_);
        if (!cancelled_) {
            const auto id = nextCallbackId_++;
            callbacks_.emplace(id, std::move(cb));
            return id;
        }
    }

    if (cb) cb();
    return 0;
}

void Context::removeCallback(const CallbackId id) {
    if (id == 0) return;
    std::scoped_lock lock(mutex_);
    callbacks_.erase(id);
}
