#pragma once

#include <filesystem>

namespace wh::paths {

inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/workhall/config.yaml";

// WORKHALL_CONFIG overrides the default location
std::filesystem::path getConfigPath();

// Creates a per-process scratch directory for test logs and returns it.
std::filesystem::path setLogPathForTesting();

std::filesystem::path getTestLogPath();

}
