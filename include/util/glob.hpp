#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace px::util {

// Case-insensitive shell glob over path components. "**" spans any number of
// directories, including none. Leading dots must be matched explicitly.
bool globMatch(std::string_view pattern, const std::filesystem::path& relPath);

// Regular files beneath root matching any pattern, as absolute paths, each once.
std::vector<std::filesystem::path> globFiles(const std::filesystem::path& root,
                                             const std::vector<std::string>& patterns);

}
