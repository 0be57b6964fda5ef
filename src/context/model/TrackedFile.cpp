#include "context/model/TrackedFile.hpp"

#include <format>
#include <stdexcept>
#include <utility>

using namespace px::context::model;

TrackedFile::TrackedFile(std::filesystem::path absPath, std::filesystem::path relPath, FileTypeInfo typeInfo)
    : absPath(std::move(absPath)),
      relPath(std::move(relPath)),
      typeInfo(std::move(typeInfo)) {}

void TrackedFile::advance(RemoteView view) {
    if (isText() && std::holds_alternative<BinaryView>(view))
        throw std::logic_error(std::format("Cannot record a binary view for text file {}", absPath.string()));

    if (!isText() && std::holds_alternative<TextView>(view))
        throw std::logic_error(std::format("Cannot record a text view for {} file {}",
                                           to_string(typeInfo.category), absPath.string()));

    remoteView_ = std::move(view);
}
