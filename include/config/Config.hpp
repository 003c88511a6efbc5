#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace wh::config {

struct ManagerConfig {
    std::size_t command_queue_capacity = 10;
    unsigned int shutdown_timeout_seconds = 0; // 0 waits for every pool, however long it takes
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum workhall  = spdlog::level::info;   // Startup/shutdown of the daemon itself
    spdlog::level::level_enum manager   = spdlog::level::info;   // Pool lifecycle commands
    spdlog::level::level_enum pool      = spdlog::level::info;   // Worker start/stop, job failures
    spdlog::level::level_enum scheduler = spdlog::level::warn;   // Tick noise only at debug
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/workhall";
    LogLevelsConfig levels;
};

struct PoolConfig {
    std::string name;
    std::string type = "working";
    unsigned int workers = 4;
    std::size_t queue_capacity = 1024;
    double calls_per_second = 0.0; // 0 disables rate limiting
    unsigned int burst = 1;
};

struct SchedulesConfig {
    bool enabled = true;
    std::filesystem::path file = "/etc/workhall/schedules.json";
};

struct Config {
    ManagerConfig manager;
    LoggingConfig logging;
    std::vector<PoolConfig> pools;
    SchedulesConfig schedules;
};

Config loadConfig(const std::string& path);
Config parseConfig(const std::string& yaml);

}
