#pragma once

#include "context/model/FileType.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace px::context::model {

struct WholeFile {
    std::string content;
    bool operator==(const WholeFile&) const = default;
};

struct Diff {
    std::string patch;
    bool operator==(const Diff&) const = default;
};

struct Deleted {
    bool operator==(const Deleted&) const = default;
};

using FileUpdate = std::variant<WholeFile, Diff, Deleted>;

enum class SyncErrorKind { Conflict, IoError, ExtractionFailed };

struct Updated {
    FileUpdate update;
};

struct Unchanged {};

struct SyncError {
    SyncErrorKind kind;
    std::string message;
};

using SyncOutcome = std::variant<Updated, Unchanged, SyncError>;

struct SyncResult {
    std::filesystem::path absPath;
    std::filesystem::path relPath;
    FileTypeInfo typeInfo;
    SyncOutcome outcome;
};

std::string_view to_string(SyncErrorKind kind);

[[nodiscard]] inline bool isUpdate(const SyncOutcome& outcome) {
    return std::holds_alternative<Updated>(outcome);
}

}
