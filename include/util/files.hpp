#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace px::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);

std::string readFileToString(const std::filesystem::path& path);

// Lexically relative path from cwd, or the path itself when it lies outside cwd.
std::filesystem::path relativeTo(const std::filesystem::path& cwd, const std::filesystem::path& absPath);

// Resolves a user supplied path against cwd and normalizes it.
std::filesystem::path resolveAgainst(const std::filesystem::path& cwd, const std::filesystem::path& path);

}
