#pragma once

#include <filesystem>
#include <string>

namespace px::preview::pdf {

// Idempotent; must run before any other pdfium call.
void init();

void shutdown();

// Text layer of every page, pages separated by a blank line.
std::string extract_text(const std::filesystem::path& path);

}
