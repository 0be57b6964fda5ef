#pragma once

#include "context/Deps.hpp"
#include "context/model/FileUpdate.hpp"
#include "diff/DiffEngine.hpp"
#include "oracle/types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace px::context {

class FileRegistry;

namespace model {
struct TrackedFile;
}

/**
 * Computes the update that brings the agent's view of one tracked file up to
 * date, and advances that view when the update is produced.
 *
 * Only the reconciled file's entry is touched. A missing file is removed from
 * the registry. Conflicts, I/O failures and extraction failures come back as
 * SyncError and leave the view untouched; anything else propagates.
 */
class Reconciler {
public:
    Reconciler(std::shared_ptr<FileRegistry> registry, Deps deps,
               unsigned int diffContext = diff::DEFAULT_CONTEXT_LINES);

    model::SyncResult reconcile(const std::shared_ptr<model::TrackedFile>& file) const;

    // Throws std::out_of_range for an untracked path.
    model::SyncResult reconcile(const std::filesystem::path& absPath) const;

private:
    std::shared_ptr<FileRegistry> registry_;
    Deps deps_;
    unsigned int diffContext_;

    model::SyncOutcome reconcileText(const std::shared_ptr<model::TrackedFile>& file) const;
    model::SyncOutcome reconcileBinary(const std::shared_ptr<model::TrackedFile>& file) const;

    // Fill content, or return the outcome that ends this reconciliation early.
    std::optional<model::SyncOutcome> readFromBuffer(const std::shared_ptr<model::TrackedFile>& file,
                                                     const oracle::BufferSyncInfo& info,
                                                     std::string& content) const;
    std::optional<model::SyncOutcome> readFromDisk(const std::shared_ptr<model::TrackedFile>& file,
                                                   std::string& content) const;

    model::SyncOutcome advanceText(model::TrackedFile& file, std::string content) const;

    model::SyncOutcome markDeleted(const std::shared_ptr<model::TrackedFile>& file) const;
};

}
