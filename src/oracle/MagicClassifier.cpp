#include "oracle/ContentClassifier.hpp"
#include "util/Magic.hpp"
#include "logging/LogRegistry.hpp"

#include <array>

using namespace px::oracle;
using namespace px::context::model;
using namespace px::logging;

namespace {

constexpr std::array<std::string_view, 4> SUPPORTED_IMAGE_TYPES = {
    "image/jpeg", "image/png", "image/gif", "image/webp"
};

constexpr std::array<std::string_view, 13> TEXTUAL_APPLICATION_TYPES = {
    "application/json", "application/xml", "application/javascript", "application/x-javascript",
    "application/x-sh", "application/x-shellscript", "application/x-yaml", "application/yaml",
    "application/toml", "application/sql", "application/x-empty", "application/csv", "image/svg+xml"
};

bool contains(const auto& haystack, const std::string_view needle) {
    for (const auto& item : haystack)
        if (item == needle) return true;
    return false;
}

}

FileCategory px::oracle::categoryForMimeType(const std::string_view mimeType) {
    if (mimeType == "application/pdf") return FileCategory::Pdf;
    if (contains(SUPPORTED_IMAGE_TYPES, mimeType)) return FileCategory::Image;
    if (mimeType.starts_with("text/")) return FileCategory::Text;
    if (mimeType == "inode/x-empty") return FileCategory::Text;
    if (contains(TEXTUAL_APPLICATION_TYPES, mimeType)) return FileCategory::Text;
    return FileCategory::Unsupported;
}

std::optional<FileTypeInfo> MagicClassifier::classify(const std::filesystem::path& absPath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(absPath, ec)) return std::nullopt;

    auto mime = util::Magic::get_mime_type(absPath.string());
    const auto category = categoryForMimeType(mime);
    LogRegistry::oracle()->debug("[MagicClassifier] {} detected as {} ({})", absPath.string(), to_string(category), mime);

    return FileTypeInfo{.category = category, .mimeType = std::move(mime)};
}
