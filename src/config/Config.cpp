#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace wh::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("[Config] Top-level YAML node must be a map");

    if (const auto node = root["manager"]) cfg.manager = node.as<ManagerConfig>();
    if (const auto node = root["logging"]) cfg.logging = node.as<LoggingConfig>();
    if (const auto node = root["schedules"]) cfg.schedules = node.as<SchedulesConfig>();

    if (const auto node = root["pools"]) {
        if (!node.IsSequence()) throw std::runtime_error("[Config] 'pools' must be a list");
        std::unordered_set<std::string> seen;
        for (const auto& entry : node) {
            auto pool = entry.as<PoolConfig>();
            if (!seen.insert(pool.name).second)
                throw std::runtime_error("[Config] Duplicate pool name: " + pool.name);
            cfg.pools.push_back(std::move(pool));
        }
    }

    if (cfg.manager.command_queue_capacity == 0)
        throw std::runtime_error("[Config] manager.command_queue_capacity must be positive");

    return cfg;
}

}

Config loadConfig(const std::string& path) {
    return fromRoot(YAML::LoadFile(path));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

}
