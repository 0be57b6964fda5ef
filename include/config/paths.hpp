#pragma once

#include <filesystem>

namespace px::paths {

constexpr const auto* CONFIG_ENV = "PARALLAX_CONFIG";
constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/parallax/config.yaml";

std::filesystem::path getConfigPath();

// Points logging at a scratch directory under the system temp dir.
std::filesystem::path getTestLogPath();

}
