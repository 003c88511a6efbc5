#include "util/paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace wh::paths {

std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("WORKHALL_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

std::filesystem::path getTestLogPath() {
    return std::filesystem::temp_directory_path() / ("workhall-test-" + std::to_string(::getpid()));
}

std::filesystem::path setLogPathForTesting() {
    const auto dir = getTestLogPath();
    std::filesystem::create_directories(dir);
    return dir;
}

}
