#pragma once

#include "concurrency/Task.hpp"
#include "context/model/RemoteView.hpp"

#include <memory>
#include <string>

namespace px::context {
class Reconciler;
class FileRegistry;
namespace model {
struct TrackedFile;
struct SyncResult;
}
}

namespace px::concurrency {

// Reconciles one tracked file. The future carries the SyncResult; a runtime
// failure the reconciler did not classify becomes an IoError result, while a
// std::logic_error is set on the future.
struct ReconcileTask final : PromisedTask {
    const context::Reconciler& reconciler;
    std::shared_ptr<context::model::TrackedFile> file;

    ReconcileTask(const context::Reconciler& reconciler, std::shared_ptr<context::model::TrackedFile> file);

    void operator()() override;

    [[nodiscard]] std::string describe() const override;

    // Puts the file back the way this task found it, re-tracking it when the
    // result removed it.
    void rollback(context::FileRegistry& registry, const context::model::SyncResult& result) const;

private:
    context::model::RemoteView previousView_{context::model::NotSeen{}};
};

}
