#pragma once

#include <string>
#include <string_view>

namespace px::context::model {

enum class FileCategory { Text, Image, Pdf, Unsupported };

struct FileTypeInfo {
    FileCategory category = FileCategory::Unsupported;
    std::string mimeType;
};

std::string_view to_string(FileCategory category);

}
