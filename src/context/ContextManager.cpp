#include "context/ContextManager.hpp"
#include "context/FileRegistry.hpp"
#include "context/model/TrackedFile.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/ReconcileTask.hpp"
#include "oracle/ContentClassifier.hpp"
#include "oracle/DiskOracle.hpp"
#include "util/contentEdits.hpp"
#include "util/files.hpp"
#include "util/glob.hpp"
#include "util/variant.hpp"
#include "logging/LogRegistry.hpp"

#include <format>
#include <future>

using namespace px::context;
using namespace px::context::model;
using namespace px::concurrency;
using namespace px::logging;
using namespace px::util;

namespace fs = std::filesystem;

ContextManager::ContextManager(fs::path cwd, Deps deps, const config::SyncConfig& sync)
    : cwd_(std::move(cwd)),
      deps_(std::move(deps)),
      registry_(std::make_shared<FileRegistry>()),
      reconciler_(registry_, deps_, sync.diff_context_lines),
      pool_(std::make_unique<ThreadPool>(sync.worker_threads)) {
    if (!cwd_.is_absolute()) cwd_ = fs::absolute(cwd_);
    LogRegistry::context()->debug("[ContextManager] Working directory {} with {} workers",
                                  cwd_.string(), pool_->workerCount());
}

ContextManager::~ContextManager() {
    pool_->stop();
}

fs::path ContextManager::resolve(const fs::path& path) const {
    return resolveAgainst(cwd_, path);
}

std::shared_ptr<TrackedFile> ContextManager::track(const fs::path& path, const FileTypeInfo& typeInfo) {
    const auto absPath = resolve(path);

    if (typeInfo.category == FileCategory::Unsupported)
        throw UnsupportedCategoryError(std::format("Cannot add {} to context: unsupported file type {}",
                                                   absPath.string(), typeInfo.mimeType));

    const auto candidate = std::make_shared<TrackedFile>(absPath, relativeTo(cwd_, absPath), typeInfo);
    const auto entry = registry_->addIfAbsent(candidate);

    if (entry == candidate)
        LogRegistry::context()->info("[ContextManager] Tracking {} ({})", entry->relPath.string(),
                                     to_string(typeInfo.category));
    return entry;
}

std::shared_ptr<TrackedFile> ContextManager::track(const fs::path& path) {
    const auto absPath = resolve(path);
    if (const auto existing = registry_->get(absPath)) return existing;

    if (!deps_.classifier) throw std::runtime_error("No content classifier configured");

    const auto typeInfo = deps_.classifier->classify(absPath);
    if (!typeInfo) throw std::runtime_error(std::format("File {} does not exist", absPath.string()));

    return track(absPath, *typeInfo);
}

bool ContextManager::untrack(const fs::path& path) {
    const auto absPath = resolve(path);
    const bool removed = registry_->remove(absPath);
    if (removed) LogRegistry::context()->info("[ContextManager] Untracked {}", relativeTo(cwd_, absPath).string());
    return removed;
}

bool ContextManager::isEmpty() const {
    return registry_->empty();
}

SyncResults ContextManager::syncAll() {
    std::scoped_lock passLock(passMutex_);

    std::vector<std::shared_ptr<ReconcileTask>> tasks;
    std::vector<std::future<ExpectedFuture>> futures;
    std::exception_ptr firstFailure;

    for (const auto& file : registry_->all()) {
        const auto task = std::make_shared<ReconcileTask>(reconciler_, file);
        auto future = task->getFuture().value();
        try {
            pool_->submit(task);
        } catch (const std::runtime_error& e) {
            LogRegistry::context()->error("[ContextManager] Failed to schedule {}: {}", task->describe(), e.what());
            firstFailure = std::current_exception();
            break;
        }
        tasks.push_back(task);
        futures.push_back(std::move(future));
    }

    SyncResults results;
    size_t updates = 0, errors = 0;

    for (auto& f : futures) {
        try {
            const auto result = f.get();
            if (!result) throw std::logic_error("Reconciliation produced no result");

            if (isUpdate(result->outcome)) ++updates;
            else if (std::holds_alternative<SyncError>(result->outcome)) ++errors;

            results.emplace(result->absPath, *result);
        } catch (const std::exception& e) {
            if (!firstFailure) firstFailure = std::current_exception();
            LogRegistry::context()->error("[ContextManager] Sync pass failure: {}", e.what());
        }
    }

    if (firstFailure) {
        // None of this pass reaches the agent, so no view may claim it did.
        for (const auto& task : tasks)
            if (const auto it = results.find(task->file->absPath); it != results.end() && isUpdate(it->second.outcome))
                task->rollback(*registry_, it->second);
        std::rethrow_exception(firstFailure);
    }

    LogRegistry::context()->debug("[ContextManager] Sync pass over {} files: {} updates, {} errors",
                                  results.size(), updates, errors);
    return results;
}

std::string ContextManager::textViewAfterEdit(const TrackedFile& file, const ToolApplication& application) const {
    if (!file.isText())
        throw std::logic_error(std::format("Cannot apply a text edit to {} file {}",
                                           to_string(file.typeInfo.category), file.absPath.string()));

    const auto* view = std::get_if<TextView>(&file.remoteView());

    // The agent never saw the original, so it now knows whatever the edit left on disk.
    if (!view) {
        try {
            return deps_.disk->readText(file.absPath);
        } catch (const std::exception& e) {
            throw std::runtime_error(std::format("Failed to read file {} to update agent's view: {}",
                                                 file.absPath.string(), e.what()));
        }
    }

    return std::visit(Overloaded{
        [&](const tool::Insert& insert) { return applyInsert(view->content, insert.insertAfter, insert.content); },
        [&](const tool::Replace& replace) { return applyReplace(view->content, replace.find, replace.replace); },
        [](const auto&) -> std::string { throw std::logic_error("Not a text edit"); }
    }, application);
}

void ContextManager::toolApplied(const fs::path& path, const ToolApplication& application) {
    std::scoped_lock passLock(passMutex_);

    const auto file = track(path);

    std::visit(Overloaded{
        [&](const tool::GetFile& get) { file->advance(TextView{get.content}); },
        [&](const tool::GetFileBinary& get) { file->advance(BinaryView{get.mtime}); },
        [&](const auto&) { file->advance(TextView{textViewAfterEdit(*file, application)}); }
    }, application);

    LogRegistry::context()->debug("[ContextManager] Agent view of {} set by tool", file->relPath.string());
}

size_t ContextManager::loadAutoContext(const std::vector<std::string>& patterns) {
    if (patterns.empty()) return 0;

    std::vector<fs::path> matches;
    try {
        matches = globFiles(cwd_, patterns);
    } catch (const fs::filesystem_error& e) {
        LogRegistry::context()->warn("[ContextManager] Error loading auto context: {}", e.what());
        return 0;
    }

    size_t added = 0;
    for (const auto& match : matches) {
        if (registry_->contains(match)) continue;
        try {
            track(match);
            ++added;
        } catch (const UnsupportedCategoryError& e) {
            LogRegistry::context()->warn("[ContextManager] Skipping auto-context file: {}", e.what());
        } catch (const std::runtime_error& e) {
            LogRegistry::context()->warn("[ContextManager] Failed to detect file type for {} during auto-context loading: {}",
                                         relativeTo(cwd_, match).string(), e.what());
        }
    }

    LogRegistry::context()->info("[ContextManager] Auto-context added {} files", added);
    return added;
}

void ContextManager::reset() {
    std::scoped_lock passLock(passMutex_);
    for (const auto& file : registry_->all()) file->forget();
    LogRegistry::context()->info("[ContextManager] Agent views reset for {} files", registry_->size());
}
