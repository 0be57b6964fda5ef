#pragma once

#include "context/Deps.hpp"
#include "context/Reconciler.hpp"
#include "context/model/FileUpdate.hpp"
#include "config/Config.hpp"
#include "oracle/types.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace px::concurrency {
class ThreadPool;
}

namespace px::context {

class FileRegistry;

struct UnsupportedCategoryError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// What a tool run by the agent did to a file. The agent already knows the
// result, so its view moves without an update being sent.
namespace tool {

struct GetFile {
    std::string content;
};

struct GetFileBinary {
    oracle::Mtime mtime{};
};

struct Insert {
    std::string insertAfter;
    std::string content;
};

struct Replace {
    std::string find;
    std::string replace;
};

}

using ToolApplication = std::variant<tool::GetFile, tool::GetFileBinary, tool::Insert, tool::Replace>;

using SyncResults = std::map<std::filesystem::path, model::SyncResult>;

class ContextManager {
public:
    ContextManager(std::filesystem::path cwd, Deps deps, const config::SyncConfig& sync = {});
    ~ContextManager();

    ContextManager(const ContextManager&) = delete;
    ContextManager& operator=(const ContextManager&) = delete;

    // Relative paths resolve against cwd. Tracking an already tracked path
    // returns the existing entry.
    std::shared_ptr<model::TrackedFile> track(const std::filesystem::path& path, const model::FileTypeInfo& typeInfo);
    std::shared_ptr<model::TrackedFile> track(const std::filesystem::path& path);

    bool untrack(const std::filesystem::path& path);

    /**
     * Reconciles every tracked file on the worker pool and returns one result
     * per file keyed by absolute path. Per-file failures come back inside the
     * map. The first failure that escapes a reconciliation is rethrown once
     * every other reconciliation has finished.
     *
     * Passes are serialized; a second caller waits for the running pass.
     */
    SyncResults syncAll();

    void toolApplied(const std::filesystem::path& path, const ToolApplication& application);

    // Tracks every supported file under cwd matching the patterns; returns how
    // many files were newly added.
    size_t loadAutoContext(const std::vector<std::string>& patterns);

    // The agent lost its context; every file is resent whole on the next pass.
    void reset();

    [[nodiscard]] bool isEmpty() const;
    [[nodiscard]] const std::filesystem::path& cwd() const { return cwd_; }
    [[nodiscard]] const std::shared_ptr<FileRegistry>& registry() const { return registry_; }

private:
    std::filesystem::path cwd_;
    Deps deps_;
    std::shared_ptr<FileRegistry> registry_;
    Reconciler reconciler_;
    std::unique_ptr<concurrency::ThreadPool> pool_;
    std::mutex passMutex_;

    [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path& path) const;
    std::string textViewAfterEdit(const model::TrackedFile& file, const ToolApplication& application) const;
};

}
