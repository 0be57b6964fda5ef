#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace px::config {

constexpr static unsigned int DEFAULT_DIFF_CONTEXT_LINES = 2;
constexpr static unsigned int DEFAULT_WORKER_THREADS = 4;

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum parallax = spdlog::level::info;   // Startup/shutdown and pass summaries
    spdlog::level::level_enum context  = spdlog::level::info;   // Tracking changes, conflicts, per-file errors
    spdlog::level::level_enum diff     = spdlog::level::warn;   // Malformed patches only
    spdlog::level::level_enum oracle   = spdlog::level::warn;   // Disk, classifier and PDF failures
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/parallax";
    LogLevelsConfig levels;
};

struct SyncConfig {
    unsigned int worker_threads = DEFAULT_WORKER_THREADS;
    unsigned int diff_context_lines = DEFAULT_DIFF_CONTEXT_LINES;
};

struct ContextConfig {
    std::vector<std::string> auto_context;
};

struct Config {
    LoggingConfig logging;
    SyncConfig sync;
    ContextConfig context;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void from_json(const nlohmann::json& j, SyncConfig& c);
void to_json(nlohmann::json& j, const ContextConfig& c);
void from_json(const nlohmann::json& j, ContextConfig& c);

} // namespace px::config
