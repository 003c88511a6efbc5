// Pools
#include "pool/Manager.hpp"
#include "pool/WorkingPool.hpp"
#include "pool/Scheduler.hpp"
#include "pool/ScheduleStore.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <unordered_map>
#include <nlohmann/json.hpp>

using namespace wh::config;
using namespace wh::pool;

namespace {
std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

using PoolMap = std::unordered_map<std::string, std::shared_ptr<WorkingPool>>;

void registerBuiltinJobs(WorkingPool& pool) {
    pool.registerJob("log", [name = pool.name()](const nlohmann::json& params) {
        wh::log::Registry::pool()->info("[{}] {}", name, params.dump());
    });
}

void startSchedules(Manager& manager, const SchedulesConfig& cfg, const PoolMap& pools) {
    const ScheduleStore store(cfg.file);
    store.ensureExists();

    std::vector<ScheduleRecord> records;
    try {
        records = store.load();
    } catch (const std::runtime_error& e) {
        wh::log::Registry::workhall()->warn("[!] Could not load schedules, continuing without them: {}", e.what());
        return;
    }

    for (const auto& record : records) {
        const auto it = pools.find(record.pool_name);
        if (it == pools.end()) {
            wh::log::Registry::workhall()->error("[-] Pool {} not found for scheduler {}, skipping",
                                                 record.pool_name, record.name);
            continue;
        }

        try {
            manager.startPool(record.name, makeScheduler(record, it->second), POOL_TYPE_SCHEDULER);
        } catch (const std::invalid_argument& e) {
            wh::log::Registry::workhall()->error("[-] Invalid scheduler {}, skipping: {}", record.name, e.what());
        }
    }

    wh::log::Registry::workhall()->info("[✓] {} scheduler(s) loaded from {}", records.size(), cfg.file.string());
}

bool serve(const Config& cfg) {
    Manager manager(cfg.manager.command_queue_capacity);
    std::thread loop([&manager] { manager.run(); });

    const auto stop = [&] {
        bool clean = true;
        if (cfg.manager.shutdown_timeout_seconds > 0)
            clean = manager.shutdownFor(std::chrono::seconds(cfg.manager.shutdown_timeout_seconds));
        else
            manager.shutdown();
        loop.join();
        return clean;
    };

    try {
        PoolMap pools;
        for (const auto& pc : cfg.pools) {
            auto pool = std::make_shared<WorkingPool>(pc.name, pc.workers, pc.queue_capacity,
                                                     pc.calls_per_second, pc.burst);
            registerBuiltinJobs(*pool);
            pools.emplace(pc.name, pool);
            manager.startPool(pc.name, pool, pc.type);
        }

        if (cfg.schedules.enabled) startSchedules(manager, cfg.schedules, pools);

        wh::log::Registry::workhall()->info("[*] Workhall started, {} pool(s) configured.", cfg.pools.size());

        while (!shouldExit) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            if (reopenLogs.exchange(false)) wh::log::Registry::reopenMainLog();
        }
    } catch (...) {
        stop();
        throw;
    }

    wh::log::Registry::workhall()->info("[*] Shutting down Workhall...");
    return stop();
}
}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init(argc > 1 ? std::filesystem::path(argv[1]) : wh::paths::getConfigPath());
        wh::log::Registry::init();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        if (!serve(ConfigRegistry::get())) {
            wh::log::Registry::workhall()->error("[-] Workhall stopped with pools still running.");
            return EXIT_FAILURE;
        }

        wh::log::Registry::workhall()->info("[✓] Workhall shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (wh::log::Registry::isInitialized())
            wh::log::Registry::workhall()->error("[-] Workhall failed: {}", e.what());
        else
            std::cerr << "[-] Workhall failed: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
