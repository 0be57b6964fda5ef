#pragma once

#include <string>
#include <string_view>

namespace px::util {

// Inserts text right after the first occurrence of insertAfter; an empty
// anchor prepends. Throws std::runtime_error when the anchor is missing.
std::string applyInsert(std::string_view content, std::string_view insertAfter, std::string_view text);

// Replaces the first occurrence of find. Throws std::runtime_error when find
// is empty or missing.
std::string applyReplace(std::string_view content, std::string_view find, std::string_view replace);

}
