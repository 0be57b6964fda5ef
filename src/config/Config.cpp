#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

namespace px::config {

namespace {

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

template <typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& out,
                   const std::filesystem::path& path, const std::string& expected) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Invalid '" + key + "' section in " + path.string() + ": " + expected);
}

}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());

    decodeSection(root, "logging", cfg.logging, path, "expected a map");
    decodeSection(root, "sync", cfg.sync, path, "expected a map");
    decodeSection(root, "context", cfg.context, path, "expected a map whose auto_context is a list");

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"logging", c.logging},
        {"sync", c.sync},
        {"context", c.context}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("sync")) j.at("sync").get_to(c.sync);
    if (j.contains("context")) j.at("context").get_to(c.context);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    c.log_dir = j.value("log_dir", std::string("/var/log/parallax"));
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = spdlog::level::from_str(j.value("console_log_level", std::string("info")));
    c.file_log_level = spdlog::level::from_str(j.value("file_log_level", std::string("warn")));
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"parallax", levelName(c.parallax)},
        {"context", levelName(c.context)},
        {"diff", levelName(c.diff)},
        {"oracle", levelName(c.oracle)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.parallax = spdlog::level::from_str(j.value("parallax", std::string("info")));
    c.context = spdlog::level::from_str(j.value("context", std::string("info")));
    c.diff = spdlog::level::from_str(j.value("diff", std::string("warn")));
    c.oracle = spdlog::level::from_str(j.value("oracle", std::string("warn")));
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"worker_threads", c.worker_threads},
        {"diff_context_lines", c.diff_context_lines}
    };
}

void from_json(const nlohmann::json& j, SyncConfig& c) {
    c.worker_threads = j.value("worker_threads", DEFAULT_WORKER_THREADS);
    c.diff_context_lines = j.value("diff_context_lines", DEFAULT_DIFF_CONTEXT_LINES);
}

void to_json(nlohmann::json& j, const ContextConfig& c) {
    j = {{"auto_context", c.auto_context}};
}

void from_json(const nlohmann::json& j, ContextConfig& c) {
    c.auto_context = j.value("auto_context", std::vector<std::string>{});
}

} // namespace px::config
