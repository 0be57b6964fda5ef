#pragma once

#include "context/model/FileType.hpp"
#include "context/model/RemoteView.hpp"

#include <filesystem>

namespace px::context::model {

struct TrackedFile {
    const std::filesystem::path absPath;
    const std::filesystem::path relPath;
    const FileTypeInfo typeInfo;

    TrackedFile(std::filesystem::path absPath, std::filesystem::path relPath, FileTypeInfo typeInfo);

    [[nodiscard]] const RemoteView& remoteView() const { return remoteView_; }
    [[nodiscard]] bool isText() const { return typeInfo.category == FileCategory::Text; }

    // Installs the view last delivered to the agent. A text view on a binary
    // file (or the reverse) throws std::logic_error.
    void advance(RemoteView view);

    void forget() { remoteView_ = NotSeen{}; }

private:
    RemoteView remoteView_{NotSeen{}};
};

}
