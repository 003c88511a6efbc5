#include "pool/Manager.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <variant>

namespace wh::pool {

using concurrency::Context;

Manager::Manager(const std::size_t commandQueueCapacity)
    : tracker_(std::make_shared<concurrency::WaitGroup>()),
      commands_(commandQueueCapacity)
{
    auto [ctx, cancel] = Context::withCancel(Context::background());
    context_ = std::move(ctx);
    cancel_ = std::move(cancel);
}

Manager::~Manager() {
    // pools hold their own references to context and tracker; this only lets
    // them wind down if shutdown() was never called
    if (cancel_) cancel_();
}

void Manager::run() {
    if (runInvoked_.exchange(true)) throw std::logic_error("[Manager] run() may only be invoked once");

    setState(State::Running);
    log::Registry::manager()->info("[Manager] Running...");

    // pop() returns nothing once the root context is cancelled
    while (auto cmd = commands_.pop(*context_)) {
        try {
            std::visit([this](auto& c) { handle(c); }, *cmd);
        } catch (const std::exception& e) {
            log::Registry::manager()->error("[Manager] Command failed: {}", e.what());
        }
    }

    setState(State::ShuttingDown);
    log::Registry::manager()->info("[Manager] Shutdown signal received. Stopping all pools...");
    cancelAll();

    setState(State::Stopped);
    log::Registry::manager()->info("[Manager] Halted.");
}

void Manager::startPool(const std::string& name, std::shared_ptr<Pool> pool, const std::string& poolType) {
    commands_.push(StartCommand{name, poolType, std::move(pool)});
}

void Manager::stopPool(const std::string& name) {
    commands_.push(StopCommand{name});
}

bool Manager::tryStartPool(const std::string& name, std::shared_ptr<Pool> pool, const std::string& poolType) {
    return commands_.tryPush(StartCommand{name, poolType, std::move(pool)});
}

bool Manager::tryStopPool(const std::string& name) {
    return commands_.tryPush(StopCommand{name});
}

std::pair<std::shared_ptr<Pool>, bool> Manager::getPool(const std::string& name) const {
    std::shared_lock lock(registryMutex_);
    const auto it = registry_.find(name);
    if (it == registry_.end()) return {nullptr, false};
    return {it->second.pool, true};
}

std::vector<PoolInfo> Manager::listPools() const {
    std::vector<PoolInfo> out;
    {
        std::shared_lock lock(registryMutex_);
        out.reserve(registry_.size());
        for (const auto& [name, entry] : registry_)
            out.push_back({name, entry.type, entry.startedAt});
    }
    std::ranges::sort(out, {}, &PoolInfo::name);
    return out;
}

Manager::State Manager::state() const {
    std::scoped_lock lock(stateMutex_);
    return state_;
}

void Manager::shutdown() {
    if (!beginShutdown()) return;
    tracker_->wait();
    finishShutdown();
}

bool Manager::shutdownFor(const std::chrono::milliseconds timeout) {
    if (!beginShutdown()) return tracker_->count() == 0;

    const bool drained = tracker_->waitFor(timeout);
    if (!drained)
        log::Registry::manager()->error("[Manager] Shutdown timed out after {}ms, abandoning {} pool(s)",
                                        timeout.count(), tracker_->count());

    finishShutdown();
    return drained;
}

void Manager::handle(StartCommand& cmd) {
    std::unique_lock lock(registryMutex_);

    if (registry_.contains(cmd.name)) {
        log::Registry::manager()->warn("[Manager] Pool '{}' already exists, ignoring start", cmd.name);
        return;
    }

    if (!cmd.pool) {
        log::Registry::manager()->warn("[Manager] Refusing to start pool '{}' without a pool handle", cmd.name);
        return;
    }

    log::Registry::manager()->info("[Manager] Starting pool '{}' (type: {})", cmd.name, cmd.type);

    auto [ctx, cancel] = Context::withCancel(context_);
    registry_.emplace(cmd.name, Entry{cmd.pool, cmd.type, std::move(cancel), std::chrono::system_clock::now()});
    tracker_->add();
    lock.unlock();

    spawn(cmd.name, cmd.pool, std::move(ctx));
}

void Manager::handle(const StopCommand& cmd) {
    Context::CancelFunc cancel;
    {
        std::scoped_lock lock(registryMutex_);

        const auto it = registry_.find(cmd.name);
        if (it == registry_.end()) {
            log::Registry::manager()->warn("[Manager] Pool '{}' not found, ignoring stop", cmd.name);
            return;
        }

        cancel = std::move(it->second.cancel);
        registry_.erase(it);
    }

    // cancel callbacks run pool code on this thread, so never under the registry lock
    log::Registry::manager()->info("[Manager] Stopping pool '{}'", cmd.name);
    cancel();
}

void Manager::spawn(const std::string& name, const std::shared_ptr<Pool>& pool, std::shared_ptr<Context> ctx) {
    try {
        std::thread([name, pool, ctx, tracker = tracker_] {
            try {
                pool->start(ctx, tracker);
            } catch (const std::exception& e) {
                log::Registry::manager()->error("[Manager] Pool '{}' exited with an error: {}", name, e.what());
            } catch (...) {
                log::Registry::manager()->error("[Manager] Pool '{}' exited with an unknown error", name);
            }
        }).detach();
    } catch (const std::system_error& e) {
        log::Registry::manager()->error("[Manager] Failed to spawn pool '{}': {}", name, e.what());
        ctx->cancel();
        {
            std::scoped_lock lock(registryMutex_);
            registry_.erase(name);
        }
        tracker_->done();
    }
}

void Manager::cancelAll() {
    std::vector<std::pair<std::string, Context::CancelFunc>> cancels;
    {
        std::shared_lock lock(registryMutex_);
        cancels.reserve(registry_.size());
        for (const auto& [name, entry] : registry_) cancels.emplace_back(name, entry.cancel);
    }

    for (const auto& [name, cancel] : cancels) {
        log::Registry::manager()->info("[Manager] Signaling pool '{}' to stop", name);
        cancel();
    }
}

void Manager::setState(const State state) {
    {
        std::scoped_lock lock(stateMutex_);
        state_ = state;
    }
    stateCv_.notify_all();
}

bool Manager::beginShutdown() {
    if (shutdownRequested_.exchange(true)) {
        log::Registry::manager()->warn("[Manager] Shutdown already requested, ignoring");
        return false;
    }

    log::Registry::manager()->info("[Manager] Initiating shutdown...");
    cancel_();

    // once the loop has stopped nothing can add to the tracker any more
    std::unique_lock lock(stateMutex_);
    stateCv_.wait(lock, [this] { return state_ == State::Created || state_ == State::Stopped; });
    return true;
}

void Manager::finishShutdown() {
    commands_.close();
    log::Registry::manager()->info("[Manager] Shutdown complete.");
}

const char* to_string(const Manager::State state) {
    switch (state) {
        case Manager::State::Created: return "created";
        case Manager::State::Running: return "running";
        case Manager::State::ShuttingDown: return "shutting_down";
        case Manager::State::Stopped: return "stopped";
    }
    return "unknown";
}

}
