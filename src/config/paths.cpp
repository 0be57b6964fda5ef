#include "config/paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace px::paths {

std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv(CONFIG_ENV); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

std::filesystem::path getTestLogPath() {
    return std::filesystem::temp_directory_path() / ("parallax_test_logs_" + std::to_string(::getpid()));
}

}
