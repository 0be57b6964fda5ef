#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace px::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["parallax"] = to_std_string(spdlog::level::to_string_view(rhs.parallax));
        node["context"]  = to_std_string(spdlog::level::to_string_view(rhs.context));
        node["diff"]     = to_std_string(spdlog::level::to_string_view(rhs.diff));
        node["oracle"]   = to_std_string(spdlog::level::to_string_view(rhs.oracle));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.parallax = spdlog::level::from_str(node["parallax"].as<std::string>("info"));
        rhs.context = spdlog::level::from_str(node["context"].as<std::string>("info"));
        rhs.diff = spdlog::level::from_str(node["diff"].as<std::string>("warn"));
        rhs.oracle = spdlog::level::from_str(node["oracle"].as<std::string>("warn"));
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
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/parallax");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["worker_threads"] = rhs.worker_threads;
        node["diff_context_lines"] = rhs.diff_context_lines;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(DEFAULT_WORKER_THREADS);
        rhs.diff_context_lines = node["diff_context_lines"].as<unsigned int>(DEFAULT_DIFF_CONTEXT_LINES);
        if (rhs.worker_threads == 0) rhs.worker_threads = 1;
        return true;
    }
};

template<>
struct convert<ContextConfig> {
    static Node encode(const ContextConfig& rhs) {
        Node node;
        node["auto_context"] = rhs.auto_context;
        return node;
    }

    static bool decode(const Node& node, ContextConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto patterns = node["auto_context"]) {
            if (!patterns.IsSequence()) return false;
            rhs.auto_context = patterns.as<std::vector<std::string>>();
        }
        return true;
    }
};

}
