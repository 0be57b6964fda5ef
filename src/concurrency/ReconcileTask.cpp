#include "concurrency/ReconcileTask.hpp"
#include "context/Reconciler.hpp"
#include "context/FileRegistry.hpp"
#include "context/model/TrackedFile.hpp"
#include "logging/LogRegistry.hpp"

#include <format>

using namespace px::concurrency;
using namespace px::context;
using namespace px::context::model;
using namespace px::logging;

ReconcileTask::ReconcileTask(const Reconciler& reconciler, std::shared_ptr<TrackedFile> file)
    : reconciler(reconciler), file(std::move(file)) {}

void ReconcileTask::operator()() {
    previousView_ = file->remoteView();

    try {
        promise.set_value(std::make_shared<SyncResult>(reconciler.reconcile(file)));
    } catch (const std::logic_error& e) {
        LogRegistry::context()->error("[ReconcileTask] Reconciliation of {} failed: {}", file->relPath.string(), e.what());
        promise.set_exception(std::current_exception());
    } catch (const std::exception& e) {
        auto message = std::format("Unexpected failure while reconciling {}: {}", file->absPath.string(), e.what());
        LogRegistry::context()->warn("[ReconcileTask] {} ({}): {}", file->relPath.string(),
                                     to_string(SyncErrorKind::IoError), message);
        promise.set_value(std::make_shared<SyncResult>(SyncResult{
            .absPath = file->absPath,
            .relPath = file->relPath,
            .typeInfo = file->typeInfo,
            .outcome = SyncError{.kind = SyncErrorKind::IoError, .message = std::move(message)}
        }));
    }
}

std::string ReconcileTask::describe() const {
    return "reconcile " + file->relPath.string();
}

void ReconcileTask::rollback(FileRegistry& registry, const SyncResult& result) const {
    if (const auto* updated = std::get_if<Updated>(&result.outcome);
        updated && std::holds_alternative<Deleted>(updated->update))
        registry.addIfAbsent(file);

    file->advance(previousView_);
    LogRegistry::context()->debug("[ReconcileTask] Rolled back the agent view of {}", file->relPath.string());
}
