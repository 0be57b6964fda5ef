#include "context/Reconciler.hpp"
#include "context/FileRegistry.hpp"
#include "context/model/TrackedFile.hpp"
#include "oracle/BufferOracle.hpp"
#include "oracle/DiskOracle.hpp"
#include "oracle/BinaryExtractor.hpp"
#include "util/encode.hpp"
#include "util/variant.hpp"
#include "logging/LogRegistry.hpp"

#include <boost/algorithm/string/join.hpp>

#include <format>
#include <stdexcept>
#include <utility>

using namespace px::context;
using namespace px::context::model;
using namespace px::oracle;
using namespace px::logging;
using namespace px::util;

namespace fs = std::filesystem;

namespace {

SyncOutcome failure(const TrackedFile& file, const SyncErrorKind kind, std::string message) {
    LogRegistry::context()->warn("[Reconciler] {} ({}): {}", file.relPath.string(), to_string(kind), message);
    return SyncError{.kind = kind, .message = std::move(message)};
}

SyncOutcome ioError(const TrackedFile& file, const std::string_view action, const std::exception& e) {
    return failure(file, SyncErrorKind::IoError,
                   std::format("Error when trying to {} {}: {}", action, file.absPath.string(), e.what()));
}

}

Reconciler::Reconciler(std::shared_ptr<FileRegistry> registry, Deps deps, const unsigned int diffContext)
    : registry_(std::move(registry)), deps_(std::move(deps)), diffContext_(diffContext) {
    if (!registry_) throw std::invalid_argument("Reconciler requires a registry");
    if (!deps_.disk) throw std::invalid_argument("Reconciler requires a disk oracle");
}

SyncResult Reconciler::reconcile(const fs::path& absPath) const {
    const auto file = registry_->get(absPath);
    if (!file) throw std::out_of_range(std::format("{} is not tracked", absPath.string()));
    return reconcile(file);
}

SyncResult Reconciler::reconcile(const std::shared_ptr<TrackedFile>& file) const {
    if (!file) throw std::invalid_argument("Cannot reconcile a null file");

    SyncResult result{.absPath = file->absPath, .relPath = file->relPath, .typeInfo = file->typeInfo, .outcome = Unchanged{}};

    bool exists = false;
    try {
        exists = deps_.disk->exists(file->absPath);
    } catch (const std::runtime_error& e) {
        result.outcome = ioError(*file, "check", e);
        return result;
    }

    if (!exists) result.outcome = markDeleted(file);
    else if (file->isText()) result.outcome = reconcileText(file);
    else if (file->typeInfo.category == FileCategory::Unsupported)
        throw std::logic_error(std::format("Unsupported file {} reached reconciliation", file->absPath.string()));
    else result.outcome = reconcileBinary(file);

    if (isUpdate(result.outcome))
        LogRegistry::context()->debug("[Reconciler] {} has an update for the agent", file->relPath.string());

    return result;
}

SyncOutcome Reconciler::reconcileText(const std::shared_ptr<TrackedFile>& file) const {
    std::optional<BufferSyncInfo> syncInfo;
    if (deps_.buffers) {
        try {
            syncInfo = deps_.buffers->syncInfo(file->absPath);
        } catch (const std::runtime_error& e) {
            return ioError(*file, "query the buffer for", e);
        }
    }

    std::string content;
    if (const auto early = syncInfo ? readFromBuffer(file, *syncInfo, content) : readFromDisk(file, content))
        return *early;

    return advanceText(*file, std::move(content));
}

std::optional<SyncOutcome> Reconciler::readFromBuffer(const std::shared_ptr<TrackedFile>& file,
                                                      const BufferSyncInfo& info,
                                                      std::string& content) const {
    try {
        const auto diskMtime = deps_.disk->stat(file->absPath).mtime;
        const auto counter = deps_.buffers->changeCounter(info.bufferId);

        const bool bufferChanged = counter != info.lastChangeCounter;
        const bool fileChanged = info.lastMtime < diskMtime;

        if (bufferChanged && fileChanged)
            return failure(*file, SyncErrorKind::Conflict,
                           std::format("Both the buffer {} and the file on disk for {} have changed. "
                                       "Cannot determine which version to use.",
                                       info.bufferId, file->absPath.string()));

        // disk is authoritative when only it moved
        if (fileChanged) deps_.buffers->reloadFromDisk(info.bufferId);

        content = boost::algorithm::join(deps_.buffers->lines(info.bufferId, LineRange{}), "\n");
        return std::nullopt;
    } catch (const fs::filesystem_error& e) {
        if (isNotFound(e)) return markDeleted(file);
        return ioError(*file, "grab the buffer contents of", e);
    } catch (const std::runtime_error& e) {
        return ioError(*file, "grab the buffer contents of", e);
    }
}

std::optional<SyncOutcome> Reconciler::readFromDisk(const std::shared_ptr<TrackedFile>& file,
                                                    std::string& content) const {
    try {
        content = deps_.disk->readText(file->absPath);
        return std::nullopt;
    } catch (const fs::filesystem_error& e) {
        if (isNotFound(e)) return markDeleted(file);
        return ioError(*file, "read", e);
    } catch (const std::runtime_error& e) {
        return ioError(*file, "read", e);
    }
}

SyncOutcome Reconciler::advanceText(TrackedFile& file, std::string content) const {
    return std::visit(Overloaded{
        [&](const NotSeen&) -> SyncOutcome {
            file.advance(TextView{content});
            return Updated{WholeFile{std::move(content)}};
        },
        [&](const TextView& seen) -> SyncOutcome {
            if (seen.content == content) return Unchanged{};

            const auto patch = diff::createPatch(seen.content, content, file.relPath.string(), diffContext_);
            // only the final newline moved
            if (patch.empty()) return Unchanged{};

            auto text = patch.str();
            file.advance(TextView{std::move(content)});
            return Updated{Diff{std::move(text)}};
        },
        [&](const BinaryView&) -> SyncOutcome {
            throw std::logic_error(std::format("Text file {} holds a binary view", file.absPath.string()));
        }
    }, file.remoteView());
}

SyncOutcome Reconciler::reconcileBinary(const std::shared_ptr<TrackedFile>& file) const {
    Mtime mtime{};
    try {
        mtime = deps_.disk->stat(file->absPath).mtime;
    } catch (const fs::filesystem_error& e) {
        if (isNotFound(e)) return markDeleted(file);
        return ioError(*file, "check file stats for", e);
    } catch (const std::runtime_error& e) {
        return ioError(*file, "check file stats for", e);
    }

    if (const auto* seen = std::get_if<BinaryView>(&file->remoteView()); seen && seen->mtime == mtime)
        return Unchanged{};

    std::string content;
    if (file->typeInfo.category == FileCategory::Pdf) {
        if (!deps_.extractor)
            return failure(*file, SyncErrorKind::ExtractionFailed, "No PDF text extractor is configured");

        try {
            content = deps_.extractor->extractText(file->absPath);
        } catch (const std::runtime_error& e) {
            return failure(*file, SyncErrorKind::ExtractionFailed,
                           std::format("Failed to extract text from {}: {}", file->absPath.string(), e.what()));
        }
    } else {
        try {
            content = base64Encode(deps_.disk->readBytes(file->absPath));
        } catch (const fs::filesystem_error& e) {
            if (isNotFound(e)) return markDeleted(file);
            return ioError(*file, "read", e);
        } catch (const std::runtime_error& e) {
            return ioError(*file, "read", e);
        }
    }

    file->advance(BinaryView{mtime});
    return Updated{WholeFile{std::move(content)}};
}

SyncOutcome Reconciler::markDeleted(const std::shared_ptr<TrackedFile>& file) const {
    registry_->remove(file);
    LogRegistry::context()->info("[Reconciler] {} was deleted or moved, removed from context", file->relPath.string());
    return Updated{Deleted{}};
}
