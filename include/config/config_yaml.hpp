#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace wh::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<ManagerConfig> {
    static Node encode(const ManagerConfig& rhs) {
        Node node;
        node["command_queue_capacity"] = rhs.command_queue_capacity;
        node["shutdown_timeout_seconds"] = rhs.shutdown_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, ManagerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.command_queue_capacity = node["command_queue_capacity"].as<std::size_t>(10);
        rhs.shutdown_timeout_seconds = node["shutdown_timeout_seconds"].as<unsigned int>(0);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["workhall"]  = to_std_string(spdlog::level::to_string_view(rhs.workhall));
        node["manager"]   = to_std_string(spdlog::level::to_string_view(rhs.manager));
        node["pool"]      = to_std_string(spdlog::level::to_string_view(rhs.pool));
        node["scheduler"] = to_std_string(spdlog::level::to_string_view(rhs.scheduler));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.workhall = spdlog::level::from_str(node["workhall"].as<std::string>("info"));
        rhs.manager = spdlog::level::from_str(node["manager"].as<std::string>("info"));
        rhs.pool = spdlog::level::from_str(node["pool"].as<std::string>("info"));
        rhs.scheduler = spdlog::level::from_str(node["scheduler"].as<std::string>("warning"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warning"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/workhall");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<PoolConfig> {
    static Node encode(const PoolConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["type"] = rhs.type;
        node["workers"] = rhs.workers;
        node["queue_capacity"] = rhs.queue_capacity;
        node["calls_per_second"] = rhs.calls_per_second;
        node["burst"] = rhs.burst;
        return node;
    }

    static bool decode(const Node& node, PoolConfig& rhs) {
        if (!node.IsMap() || !node["name"]) return false;
        rhs.name = node["name"].as<std::string>();
        rhs.type = node["type"].as<std::string>("working");
        rhs.workers = node["workers"].as<unsigned int>(4);
        rhs.queue_capacity = node["queue_capacity"].as<std::size_t>(1024);
        rhs.calls_per_second = node["calls_per_second"].as<double>(0.0);
        rhs.burst = node["burst"].as<unsigned int>(1);
        return true;
    }
};

template<>
struct convert<SchedulesConfig> {
    static Node encode(const SchedulesConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["file"] = rhs.file.string();
        return node;
    }

    static bool decode(const Node& node, SchedulesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.file = node["file"].as<std::string>("/etc/workhall/schedules.json");
        return true;
    }
};

}
