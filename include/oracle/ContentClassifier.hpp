#pragma once

#include "context/model/FileType.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace px::oracle {

class ContentClassifier {
public:
    virtual ~ContentClassifier() = default;

    // Empty when the file does not exist.
    virtual std::optional<context::model::FileTypeInfo> classify(const std::filesystem::path& absPath) = 0;
};

// libmagic backed classifier.
class MagicClassifier final : public ContentClassifier {
public:
    std::optional<context::model::FileTypeInfo> classify(const std::filesystem::path& absPath) override;
};

// Maps a MIME type reported by libmagic onto the categories the engine can sync.
context::model::FileCategory categoryForMimeType(std::string_view mimeType);

}
