// Context
#include "context/ContextManager.hpp"
#include "context/FileRegistry.hpp"
#include "context/model/TrackedFile.hpp"
#include "context/render.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "preview/pdf.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace px::config;
using namespace px::context;
using namespace px::logging;

namespace fs = std::filesystem;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int signum) {
    LogRegistry::parallax()->info("[!] Signal {} received. Shutting down gracefully...", std::to_string(signum));
    shouldExit = true;
}

struct Options {
    std::optional<fs::path> configPath;
    fs::path cwd = fs::current_path();
    bool json = false;
    bool dumpConfig = false;
    std::vector<fs::path> files;
};

constexpr auto* USAGE =
    "usage: parallax [--config FILE] [--cwd DIR] [--json] [--dump-config] [FILE...]\n"
    "commands (stdin): <empty>|sync, add PATH, rm PATH, reset, list, quit\n";

Options parseArgs(const int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        const auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "--config") opts.configPath = value();
        else if (arg == "--cwd") opts.cwd = fs::absolute(value());
        else if (arg == "--json") opts.json = true;
        else if (arg == "--dump-config") opts.dumpConfig = true;
        else if (arg.starts_with("--")) throw std::invalid_argument("Unknown option " + arg);
        else opts.files.emplace_back(arg);
    }
    return opts;
}

std::pair<std::string, std::string> splitCommand(const std::string& line) {
    const auto start = line.find_first_not_of(" \t");
    if (start == std::string::npos) return {};
    const auto end = line.find_first_of(" \t", start);
    if (end == std::string::npos) return {line.substr(start), {}};

    const auto argStart = line.find_first_not_of(" \t", end);
    const auto argEnd = line.find_last_not_of(" \t\r");
    if (argStart == std::string::npos) return {line.substr(start, end - start), {}};
    return {line.substr(start, end - start), line.substr(argStart, argEnd - argStart + 1)};
}

void runPass(ContextManager& manager, const bool json) {
    try {
        const auto results = manager.syncAll();
        std::cout << renderSummary(results);
        if (json) std::cout << toProviderContent(results).dump(2) << std::endl;
    } catch (const std::exception& e) {
        LogRegistry::parallax()->error("[-] Sync pass failed: {}", e.what());
        std::cout << "sync failed: " << e.what() << "\n";
    }
    std::cout.flush();
}

void addFile(ContextManager& manager, const fs::path& path) {
    try {
        const auto file = manager.track(path);
        std::cout << "added " << file->relPath.string() << " (" << to_string(file->typeInfo.category) << ")\n";
    } catch (const UnsupportedCategoryError& e) {
        std::cout << e.what() << "\n";
    } catch (const std::runtime_error& e) {
        std::cout << "failed to add " << path.string() << ": " << e.what() << "\n";
    }
}

void commandLoop(ContextManager& manager, const bool json) {
    std::string line;
    while (!shouldExit && std::getline(std::cin, line)) {
        const auto [command, arg] = splitCommand(line);

        if (command.empty() || command == "sync") runPass(manager, json);
        else if (command == "add" && !arg.empty()) addFile(manager, arg);
        else if (command == "rm" && !arg.empty()) {
            if (!manager.untrack(arg)) std::cout << arg << " is not tracked\n";
        }
        else if (command == "reset") manager.reset();
        else if (command == "list") {
            for (const auto& file : manager.registry()->all())
                std::cout << file->relPath.string() << " " << file->typeInfo.mimeType << "\n";
        }
        else if (command == "quit") break;
        else std::cout << USAGE;
    }
}

}

int main(const int argc, char** argv) {
    Options opts;
    try {
        opts = parseArgs(argc, argv);
        if (opts.configPath) ConfigRegistry::init(*opts.configPath);
        else ConfigRegistry::init();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << USAGE;
        return EXIT_FAILURE;
    }

    if (opts.dumpConfig) {
        std::cout << nlohmann::json(ConfigRegistry::get()).dump(2) << std::endl;
        return EXIT_SUCCESS;
    }

    try {
        LogRegistry::init();
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to initialize logging: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        LogRegistry::parallax()->info("[*] Initializing Parallax in {}", opts.cwd.string());

        const auto& config = ConfigRegistry::get();
        ContextManager manager(opts.cwd, Deps::local(), config.sync);

        manager.loadAutoContext(config.context.auto_context);
        for (const auto& file : opts.files) addFile(manager, file);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        LogRegistry::parallax()->info("[✓] Tracking {} files", manager.registry()->size());

        commandLoop(manager, opts.json);

        LogRegistry::parallax()->info("[*] Shutting down Parallax...");
    } catch (const std::exception& e) {
        LogRegistry::parallax()->error("[-] Parallax failed: {}", e.what());
        px::preview::pdf::shutdown();
        LogRegistry::shutdown();
        return EXIT_FAILURE;
    }

    px::preview::pdf::shutdown();
    LogRegistry::parallax()->info("[✓] Parallax shut down cleanly.");
    LogRegistry::shutdown();
    return EXIT_SUCCESS;
}
